#include "performance_monitor.hpp"
#include "utils.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {

long long millis(std::chrono::nanoseconds d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

std::string grade(double value, const char* metric, double excellent, const char* excellent_label,
                  double good, const char* good_label, double fair, const char* fair_label,
                  const char* poor_label, bool higher_is_better) {
    auto meets = [&](double threshold) { return higher_is_better ? value >= threshold : value <= threshold; };

    std::string line = std::string(metric) + ": ";
    if (meets(excellent)) return line + excellent_label;
    if (meets(good)) return line + good_label;
    if (meets(fair)) return line + fair_label;
    return line + poor_label;
}

} // namespace

PerformanceMonitor::PerformanceMonitor(std::chrono::milliseconds target_duration, std::ostream& out)
    : start_time_(std::chrono::steady_clock::now()), target_duration_(target_duration), out_(out) {}

void PerformanceMonitor::print_progress_report(const PerformanceResults& results,
                                               const LoadController& controller) const {
    const auto elapsed = std::chrono::steady_clock::now() - start_time_;
    const double elapsed_sec = std::chrono::duration<double>(elapsed).count();
    const double target_sec = std::chrono::duration<double>(target_duration_).count();

    double progress = target_sec > 0.0 ? std::min(100.0, elapsed_sec / target_sec * 100.0) : 0.0;
    const int bar_width = 20;
    const int filled = static_cast<int>(progress / 100.0 * bar_width);

    // Formatted locally so the caller's stream flags stay untouched.
    std::ostringstream report;
    report << std::fixed << std::setprecision(1);
    report << "\nPerformance Test Progress\n"
         << "  [" << std::string(filled, '=') << std::string(bar_width - filled, '-') << "] "
         << progress << "% (" << format_duration(elapsed) << " / " << format_duration(target_duration_) << ")\n"
         << "  Load Pattern: " << controller.current_phase_description() << "\n";

    if (results.total_requests > 0) {
        const double current_rps = elapsed_sec >= 1.0 ? results.total_requests / elapsed_sec : 0.0;
        report << "  Current RPS: " << current_rps << "\n"
             << "  Total Requests: " << results.total_requests << "\n"
             << "  Success Rate: " << results.success_rate * 100.0 << "%\n";
        if (results.average_response_time.count() > 0) {
            report << "  Avg Response Time: " << millis(results.average_response_time) << "ms\n"
                 << "  P95 Response Time: " << millis(results.p95_response_time) << "ms\n";
        }
        if (results.failed_requests > 0) {
            report << "  Errors: " << results.failed_requests << "\n";
        }
    }

    if (elapsed < target_duration_) {
        report << "  Time Remaining: " << format_duration(target_duration_ - elapsed) << "\n";
    }
    out_ << report.str();
    out_.flush();
}

void PerformanceMonitor::print_final_summary(const PerformanceResults& r) const {
    const std::string rule(60, '=');

    std::ostringstream report;
    report << std::fixed << std::setprecision(2);
    report << "\n" << rule << "\nFinal Performance Results\n" << rule << "\n";

    report << "\nTest Summary:\n"
         << "  Total Duration: " << format_duration(r.total_duration) << "\n"
         << "  Total Requests: " << r.total_requests << "\n"
         << "  Successful: " << r.successful_requests << "\n"
         << "  Failed: " << r.failed_requests << "\n"
         << "  Success Rate: " << r.success_rate * 100.0 << "%\n";

    report << "\nPerformance Metrics:\n"
         << "  Requests/sec: " << std::setprecision(1) << r.requests_per_second << "\n"
         << "  Avg Response: " << millis(r.average_response_time) << "ms\n"
         << "  Min Response: " << millis(r.min_response_time) << "ms\n"
         << "  Max Response: " << millis(r.max_response_time) << "ms\n";

    report << "\nResponse Time Percentiles:\n"
         << "  P50 (median): " << millis(r.p50_response_time) << "ms\n"
         << "  P95: " << millis(r.p95_response_time) << "ms\n"
         << "  P99: " << millis(r.p99_response_time) << "ms\n";

    if (!r.status_code_distribution.empty()) {
        report << "\nStatus Code Distribution:\n";
        for (const auto& entry : r.status_code_distribution) {
            report << "  " << entry.first << ": " << entry.second << "\n";
        }
    }

    if (r.bytes_per_second_received > 0.0) {
        report << std::setprecision(2) << "\nNetwork Traffic:\n"
             << "  Data Sent: " << r.bytes_per_second_sent / 1024.0 / 1024.0 << " MB/s\n"
             << "  Data Received: " << r.bytes_per_second_received / 1024.0 / 1024.0 << " MB/s\n";
    }

    report << "\nPerformance Assessment:\n";
    for (const auto& line : assess(r)) {
        report << "  " << line << "\n";
    }
    report << rule << "\n";
    out_ << report.str();
    out_.flush();
}

std::vector<std::string> PerformanceMonitor::assess(const PerformanceResults& r) {
    return {
        grade(r.success_rate * 100.0, "Success Rate", 99.0, "Excellent (>=99%)", 95.0, "Good (>=95%)",
              90.0, "Fair (>=90%)", "Poor (<90%)", true),
        grade(static_cast<double>(millis(r.average_response_time)), "Avg Response", 100, "Excellent (<=100ms)",
              500, "Good (<=500ms)", 1000, "Fair (<=1s)", "Poor (>1s)", false),
        grade(static_cast<double>(millis(r.p95_response_time)), "P95 Response", 200, "Excellent (<=200ms)",
              1000, "Good (<=1s)", 2000, "Fair (<=2s)", "Poor (>2s)", false),
        grade(r.requests_per_second, "Throughput", 100.0, "High (>=100 RPS)", 50.0, "Medium (>=50 RPS)",
              10.0, "Low (>=10 RPS)", "Very Low (<10 RPS)", true),
    };
}
