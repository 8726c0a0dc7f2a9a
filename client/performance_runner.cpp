#include "performance_runner.hpp"
#include "performance_monitor.hpp"
#include "suite_loader.hpp"
#include "test_runner.hpp"
#include "utils.h"
#include "workloads/suite_workload.hpp"

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

std::atomic<bool> PerformanceRunner::stop_requested_{false};

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

} // namespace

void PerfConfig::validate() const {
    if (concurrent_users == 0) {
        throw std::invalid_argument("Concurrent users must be at least 1");
    }
    if (target_rps && *target_rps == 0) {
        throw std::invalid_argument("Target RPS must be greater than 0");
    }
    if (test_duration.count() <= 0) {
        throw std::invalid_argument("Test duration must be greater than 0");
    }
    if (report_interval.count() <= 0) {
        throw std::invalid_argument("Report interval must be greater than 0");
    }
    if (success_threshold < 0.0 || success_threshold > 1.0) {
        throw std::invalid_argument("Success threshold must be between 0 and 1");
    }
}

PerformanceRunner::PerformanceRunner(PerfConfig config, EnvironmentSource env, std::ostream& out)
    : config_(std::move(config)), executor_(config_.request_timeout), env_(std::move(env)), out_(out) {
    config_.validate();
}

PerformanceResults PerformanceRunner::run_performance_test(const std::filesystem::path& target,
                                                           const std::optional<std::string>& env) {
    std::vector<NamedSuite> suites;
    try {
        suites = load_test_suites(target);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to load test suite for performance testing: ") + e.what());
    }
    if (suites.empty()) {
        throw std::runtime_error("No test suites found in target path");
    }
    if (suites.size() > 1) {
        spdlog::info("{} suites found, using '{}'", suites.size(), suites.front().first);
    }

    const auto& named = suites.front();
    SuiteWorkload workload(named.first, named.second, build_suite_context(named.second, env, env_));

    out_ << "Starting performance test on suite: " << named.first << "\n"
         << "   Tests to execute: " << workload.step_count() << "\n";
    return run_workload(workload, named.first);
}

PerformanceResults PerformanceRunner::run_workload(const IWorkload& workload, const std::string& label) {
    stop_requested_.store(false);

    out_ << "   Concurrent users: " << config_.concurrent_users << "\n";
    if (config_.target_rps) {
        out_ << "   Target RPS: " << *config_.target_rps << "\n";
    }
    out_ << "   Test duration: " << format_duration(config_.test_duration) << "\n"
         << "   Load pattern: " << to_string(config_.pattern) << "\n";
    out_.flush();

    // Preparation runs on a private copy so the template stays untouched.
    auto prepared = workload.clone(0);
    try {
        prepared->prepare(executor_);
    } catch (const std::exception& e) {
        spdlog::warn("Preparation for '{}' failed: {}", label, e.what());
    }

    if (config_.warmup.count() > 0) {
        out_ << "\nWarming up for " << format_duration(config_.warmup) << "...\n";
        out_.flush();
        interruptible_sleep(config_.warmup);
    }

    out_ << "\nStarting load generation...\n";
    out_.flush();

    PerformanceMetrics metrics;
    LoadController controller(config_.pattern, config_.target_rps, config_.concurrent_users, config_.warmup);
    PerformanceMonitor monitor(config_.test_duration, out_);

    keep_running_.store(true);
    workers_finished_.store(0);

    // One set of keep-alive connections per worker, as each owns its client.
    std::vector<std::unique_ptr<ClientPool>> pools;
    std::vector<std::thread> threads;
    threads.reserve(config_.concurrent_users);
    for (unsigned i = 0; i < config_.concurrent_users; ++i) {
        pools.push_back(std::make_unique<ClientPool>(config_.request_timeout));
        threads.emplace_back(&PerformanceRunner::worker, this, i, workload.clone(i), std::ref(*pools.back()),
                             std::ref(metrics), std::cref(controller));
    }

    // Reporter: wakes every report_interval until the load phase ends.
    std::mutex reporter_mutex;
    std::condition_variable reporter_cv;
    bool reporter_stop = false;
    std::thread reporter([&] {
        std::unique_lock<std::mutex> lock(reporter_mutex);
        while (!reporter_cv.wait_for(lock, config_.report_interval, [&] { return reporter_stop; })) {
            lock.unlock();
            monitor.print_progress_report(metrics.calculate_results(), controller);
            lock.lock();
        }
    });

    const auto deadline = std::chrono::steady_clock::now() + config_.test_duration;
    std::string stop_reason;
    while (stop_reason.empty()) {
        if (workers_finished_.load() == config_.concurrent_users) {
            stop_reason = "All workers finished";
        } else if (stop_requested_.load()) {
            stop_reason = "Stop requested";
        } else if (std::chrono::steady_clock::now() >= deadline) {
            stop_reason = "Test duration reached";
        } else {
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    keep_running_.store(false);
    {
        std::lock_guard<std::mutex> lock(reporter_mutex);
        reporter_stop = true;
    }
    reporter_cv.notify_one();
    reporter.join();

    out_ << "\n" << stop_reason << ", stopping load generation...\n";
    out_.flush();

    // Let in-flight requests land before the authoritative snapshot.
    std::this_thread::sleep_for(config_.grace_period);
    PerformanceResults results = metrics.calculate_results();

    // Stragglers no longer count; don't wait out their timeouts.
    for (auto& pool : pools) pool->stop();
    for (auto& t : threads) t.join();

    monitor.print_final_summary(results);
    return results;
}

void PerformanceRunner::worker(unsigned worker_id, std::unique_ptr<IWorkload> workload, ClientPool& clients,
                               PerformanceMetrics& metrics, const LoadController& controller) {
    const auto worker_deadline = std::chrono::steady_clock::now() + config_.test_duration;
    const auto last_counted = worker_deadline + config_.grace_period;

    try {
        while (keep_running_.load() && std::chrono::steady_clock::now() < worker_deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                last_counted - std::chrono::steady_clock::now());
            clients.set_timeout(std::max(std::chrono::milliseconds(1),
                                         std::min(config_.request_timeout, remaining)));

            WorkloadOutcome outcome = workload->execute(executor_, clients);
            const TestResult& r = outcome.result;

            const int status = r.response_status.value_or(0);
            if (!r.passed && status == 0) {
                metrics.record_connection_error();
                spdlog::trace("worker {}: {}", worker_id, r.error.value_or("connection error"));
            } else {
                const uint64_t received = r.response_body ? r.response_body->size() : 0;
                metrics.record_request(r.duration, status, outcome.bytes_sent, received, !r.passed);
            }

            if (auto delay = controller.request_delay()) {
                pause_worker(*delay);
            }
            pause_worker(config_.request_pause);
        }
    } catch (const std::exception& e) {
        spdlog::error("Worker {} stopped: {}", worker_id, e.what());
    }

    workers_finished_.fetch_add(1);
}

void PerformanceRunner::interruptible_sleep(std::chrono::milliseconds d) const {
    const auto until = std::chrono::steady_clock::now() + d;
    while (!stop_requested_.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= until) return;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kPollInterval, until - now));
    }
}

void PerformanceRunner::pause_worker(std::chrono::milliseconds d) const {
    const auto until = std::chrono::steady_clock::now() + d;
    while (keep_running_.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= until) return;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kPollInterval, until - now));
    }
}

void PerformanceRunner::check_verdict(const PerformanceResults& results) const {
    if (results.success_rate < config_.success_threshold) {
        throw std::runtime_error("Performance test failed: Success rate " + format_percent(results.success_rate) +
                                 " is below " +
                                 std::to_string(static_cast<int>(config_.success_threshold * 100.0 + 0.5)) + "%");
    }
    if (results.p99_response_time > std::chrono::seconds(1)) {
        spdlog::warn("P99 response time {} exceeds 1s", format_duration(results.p99_response_time));
    }
}
