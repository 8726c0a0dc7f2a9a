#include <csignal>
#include <iostream>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "load_controller.hpp"
#include "performance_runner.hpp"
#include "test_runner.hpp"
#include "utils.h"

namespace {

void on_signal(int) {
    PerformanceRunner::request_stop();
}

std::optional<std::string> opt(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

int handle_run(const std::string& target, const std::string& env, const RunnerOptions& options) {
    TestRunner runner(options);
    spdlog::debug("Running '{}' (parallel {}, bail {})", target, options.parallel, options.bail);

    auto results = runner.run_tests(target, opt(env));
    return runner.print_overall_summary(results) ? 0 : 1;
}

int handle_perf(const std::string& target, const std::string& env, const PerfConfig& config,
                const std::string& output) {
    PerformanceRunner runner(config);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    PerformanceResults results = runner.run_performance_test(target, opt(env));
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    std::cout << "\nPerformance test completed\n";
    if (!output.empty()) {
        results.save_report(output);
        std::cout << "Results saved to: " << output << "\n";
    }

    runner.check_verdict(results);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"rivet - declarative API and load testing"};
    app.require_subcommand(1);
    app.fallthrough();

    std::string log_level = "warn";
    app.add_option("-l,--log-level", log_level, "Log level: trace | debug | info | warn | error | off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}))
        ->default_val(log_level);

    // --- rivet run ---
    auto* run_cmd = app.add_subcommand("run", "Run test suites");
    std::string run_target;
    std::string run_env;
    std::string run_timeout = "30s";
    std::string run_grep;
    RunnerOptions run_options;
    run_cmd->add_option("target", run_target, "Suite file or directory")->required();
    run_cmd->add_option("--env", run_env, "Environment name, exposed as RIVET_ENV");
    run_cmd->add_option("--parallel", run_options.parallel, "Number of parallel workers")
        ->check(CLI::PositiveNumber)
        ->default_val(1);
    run_cmd->add_option("--grep", run_grep, "Only run steps whose name contains this text");
    run_cmd->add_flag("--bail", run_options.bail, "Stop on first failure");
    run_cmd->add_option("--timeout", run_timeout, "Per-request timeout (e.g. 500ms, 30s, 1m)")
        ->default_val(run_timeout);
    run_cmd->add_flag("--ci", run_options.ci, "Plain output without colours");

    // --- rivet perf ---
    auto* perf_cmd = app.add_subcommand("perf", "Run performance tests");
    std::string perf_target;
    std::string perf_env;
    std::string duration = "30s";
    std::string warmup = "5s";
    std::string report_interval = "5s";
    std::string pattern = "constant";
    std::string output;
    unsigned rps = 0;
    PerfConfig perf_config;
    perf_cmd->add_option("target", perf_target, "Suite file or directory")->required();
    perf_cmd->add_option("--duration", duration, "Test duration (e.g. 30s, 5m)")->default_val(duration);
    auto* rps_opt = perf_cmd->add_option("--rps", rps, "Target requests per second")->check(CLI::PositiveNumber);
    perf_cmd->add_option("--concurrent", perf_config.concurrent_users, "Number of concurrent users")
        ->check(CLI::PositiveNumber)
        ->default_val(10);
    perf_cmd->add_option("--warmup", warmup, "Warm-up duration")->default_val(warmup);
    perf_cmd->add_option("--report-interval", report_interval, "Progress report interval")
        ->default_val(report_interval);
    perf_cmd->add_option("--output", output, "Write results as JSON to this file");
    perf_cmd->add_option("--pattern", pattern, "Load pattern: constant | ramp-up | spike")->default_val(pattern);
    perf_cmd->add_option("--env", perf_env, "Environment name, exposed as RIVET_ENV");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(spdlog::level::from_str(log_level));

    try {
        if (*run_cmd) {
            run_options.timeout = parse_duration(run_timeout);
            if (!run_grep.empty()) run_options.filter = run_grep;
            return handle_run(run_target, run_env, run_options);
        }

        perf_config.test_duration = parse_duration(duration);
        perf_config.warmup = parse_duration(warmup);
        perf_config.report_interval = parse_duration(report_interval);
        perf_config.pattern = parse_load_pattern(pattern);
        if (rps_opt->count() > 0) perf_config.target_rps = rps;

        std::cout << "Starting performance test\n"
                  << "Target: " << perf_target << "\n"
                  << "Duration: " << duration << "\n";
        return handle_perf(perf_target, perf_env, perf_config, output);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
