#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "load_controller.hpp"
#include "performance_metrics.hpp"
#include "request_executor.hpp"
#include "variable_context.hpp"
#include "workload.hpp"

struct PerfConfig {
    unsigned concurrent_users = 10;
    std::optional<unsigned> target_rps;
    std::chrono::milliseconds test_duration{30000};
    std::chrono::milliseconds warmup{5000};
    std::chrono::milliseconds report_interval{5000};
    LoadPattern pattern = LoadPattern::Constant;
    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds grace_period{2000};    // after stop, before the final snapshot
    std::chrono::milliseconds request_pause{1};      // after every request
    double success_threshold = 0.95;

    // Throws std::invalid_argument on the first bad field.
    void validate() const;
};

/**
 * @brief Drives concurrent workers against a workload for a fixed time.
 *
 * Lifecycle: prepare, warm-up with no load, then concurrent_users worker
 * threads each looping over the workload until the duration elapses, all
 * workers finish, or a stop is requested. Stopping clears one flag that
 * every worker checks before its next request. Requests that complete
 * within the grace period still count; the final snapshot is taken when
 * it ends. Connections still busy at that point are shut down before the
 * worker threads are joined, and no request timeout reaches past the end
 * of the grace period.
 */
class PerformanceRunner {
public:
    explicit PerformanceRunner(PerfConfig config,
                               EnvironmentSource env = EnvironmentSource::process(),
                               std::ostream& out = std::cout);

    // Loads the first suite at target and runs it as a SuiteWorkload.
    PerformanceResults run_performance_test(const std::filesystem::path& target,
                                            const std::optional<std::string>& env);

    PerformanceResults run_workload(const IWorkload& workload, const std::string& label);

    // Throws std::runtime_error when the success rate is under the
    // configured threshold. Warns when p99 exceeds one second.
    void check_verdict(const PerformanceResults& results) const;

    const PerfConfig& config() const { return config_; }

    // Async-signal-safe. Ends the current (or next) run as if its duration
    // had elapsed.
    static void request_stop() { stop_requested_.store(true); }
    static bool stop_requested() { return stop_requested_.load(); }

private:
    void worker(unsigned worker_id, std::unique_ptr<IWorkload> workload, ClientPool& clients,
                PerformanceMetrics& metrics, const LoadController& controller);

    // Sleeps up to d, returning early on a stop request.
    void interruptible_sleep(std::chrono::milliseconds d) const;

    // Sleeps up to d, returning early once the load phase ends.
    void pause_worker(std::chrono::milliseconds d) const;

    PerfConfig config_;
    RequestExecutor executor_;
    EnvironmentSource env_;
    std::ostream& out_;

    std::atomic<bool> keep_running_{false};
    std::atomic<unsigned> workers_finished_{0};

    static std::atomic<bool> stop_requested_;
};
