#include "performance_metrics.hpp"
#include "utils.h"

#include <algorithm>

namespace {

int64_t to_millis(std::chrono::nanoseconds d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

} // namespace

nlohmann::json PerformanceResults::to_json() const {
    nlohmann::json distribution = nlohmann::json::object();
    for (const auto& entry : status_code_distribution) {
        distribution[std::to_string(entry.first)] = entry.second;
    }

    return {
        {"total_requests", total_requests},
        {"successful_requests", successful_requests},
        {"failed_requests", failed_requests},
        {"success_rate", success_rate},
        {"requests_per_second", requests_per_second},
        {"average_response_time", to_millis(average_response_time)},
        {"min_response_time", to_millis(min_response_time)},
        {"max_response_time", to_millis(max_response_time)},
        {"p50_response_time", to_millis(p50_response_time)},
        {"p95_response_time", to_millis(p95_response_time)},
        {"p99_response_time", to_millis(p99_response_time)},
        {"status_code_distribution", distribution},
        {"bytes_per_second_sent", bytes_per_second_sent},
        {"bytes_per_second_received", bytes_per_second_received},
        {"connection_errors", connection_errors},
        {"total_duration", to_millis(total_duration)},
    };
}

void PerformanceResults::save_report(const std::string& path) const {
    write_json_file(to_json(), path);
}

PerformanceMetrics::PerformanceMetrics() : start_time_(std::chrono::steady_clock::now()) {}

void PerformanceMetrics::record_request(std::chrono::nanoseconds response_time, int status_code,
                                        uint64_t bytes_sent, uint64_t bytes_received, bool is_error) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.response_times.push_back(response_time);
    samples_.request_count++;
    samples_.bytes_sent += bytes_sent;
    samples_.bytes_received += bytes_received;
    samples_.status_codes[status_code]++;
    if (is_error) samples_.error_count++;
}

void PerformanceMetrics::record_connection_error() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.connection_errors++;
    samples_.error_count++;
}

PerformanceMetrics::Samples PerformanceMetrics::copy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_;
}

void PerformanceMetrics::merge(const PerformanceMetrics& other) {
    if (&other == this) return;
    Samples incoming = other.copy();

    std::lock_guard<std::mutex> lock(mutex_);
    samples_.response_times.insert(samples_.response_times.end(), incoming.response_times.begin(),
                                   incoming.response_times.end());
    samples_.error_count += incoming.error_count;
    samples_.request_count += incoming.request_count;
    samples_.bytes_sent += incoming.bytes_sent;
    samples_.bytes_received += incoming.bytes_received;
    samples_.connection_errors += incoming.connection_errors;
    for (const auto& entry : incoming.status_codes) {
        samples_.status_codes[entry.first] += entry.second;
    }
}

PerformanceResults PerformanceMetrics::calculate_results() const {
    Samples s = copy();
    const auto total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time_);

    PerformanceResults r;
    r.total_requests = s.request_count + s.connection_errors;
    r.failed_requests = s.error_count;
    r.status_code_distribution = s.status_codes;
    r.connection_errors = s.connection_errors;
    r.total_duration = total_duration;

    if (s.response_times.empty()) {
        return r;
    }

    std::sort(s.response_times.begin(), s.response_times.end());
    const auto& sorted = s.response_times;
    const size_t n = sorted.size();

    // error_count already includes connection errors.
    r.successful_requests = s.request_count + s.connection_errors - s.error_count;
    if (r.total_requests > 0) {
        r.success_rate = static_cast<double>(r.total_requests - s.error_count) /
                         static_cast<double>(r.total_requests);
    }

    std::chrono::nanoseconds::rep sum = 0;
    for (const auto& d : sorted) sum += d.count();
    r.average_response_time = std::chrono::nanoseconds(sum / static_cast<std::chrono::nanoseconds::rep>(n));

    r.min_response_time = sorted.front();
    r.max_response_time = sorted.back();
    r.p50_response_time = sorted[n * 50 / 100];
    r.p95_response_time = sorted[n * 95 / 100];
    r.p99_response_time = sorted[n * 99 / 100];

    const double secs = std::chrono::duration<double>(total_duration).count();
    if (secs > 0.0) {
        r.requests_per_second = static_cast<double>(r.total_requests) / secs;
        r.bytes_per_second_sent = static_cast<double>(s.bytes_sent) / secs;
        r.bytes_per_second_received = static_cast<double>(s.bytes_received) / secs;
    }
    return r;
}
