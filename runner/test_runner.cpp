#include "test_runner.hpp"
#include "chunked.hpp"
#include "dataset.hpp"
#include "suite_loader.hpp"
#include "utils.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace {

const char* kGreen = "\033[32m";
const char* kRed = "\033[31m";
const char* kCyan = "\033[1;36m";
const char* kReset = "\033[0m";

std::chrono::nanoseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

TestRunner::TestRunner(RunnerOptions options, EnvironmentSource env, std::ostream& out)
    : options_(std::move(options)), executor_(options_.timeout), env_(std::move(env)), out_(out) {
    if (options_.parallel == 0) {
        throw std::invalid_argument("Parallel workers must be at least 1");
    }
}

std::vector<TestSuiteResult> TestRunner::run_tests(const std::filesystem::path& target,
                                                   const std::optional<std::string>& env) const {
    auto suites = load_test_suites(target);
    return run_suites(suites, env);
}

std::vector<TestSuiteResult> TestRunner::run_suites(const std::vector<NamedSuite>& suites,
                                                    const std::optional<std::string>& env) const {
    if (suites.size() <= 1 || options_.parallel <= 1) {
        return run_suites_sequential(suites, env);
    }
    return run_suites_parallel(suites, env);
}

std::vector<TestSuiteResult> TestRunner::run_suites_sequential(const std::vector<NamedSuite>& suites,
                                                               const std::optional<std::string>& env) const {
    std::vector<TestSuiteResult> all_results;

    for (const auto& suite : suites) {
        print_suite_start(suite.first);
        TestSuiteResult result = run_suite(suite, env, options_.parallel);
        print_suite_summary(result);

        bool failed = result.failed > 0;
        all_results.push_back(std::move(result));
        if (options_.bail && failed) break;
    }
    return all_results;
}

std::vector<TestSuiteResult> TestRunner::run_suites_parallel(const std::vector<NamedSuite>& suites,
                                                             const std::optional<std::string>& env) const {
    std::vector<TestSuiteResult> all_results;

    std::function<TestSuiteResult(const NamedSuite&)> task = [this, &env](const NamedSuite& suite) {
        print_suite_start(suite.first);
        // Suites already run side by side; steps inside each stay sequential.
        return run_suite(suite, env, 1);
    };
    std::function<bool(TestSuiteResult&&)> collect = [this, &all_results](TestSuiteResult&& result) {
        print_suite_summary(result);
        bool failed = result.failed > 0;
        all_results.push_back(std::move(result));
        return !(options_.bail && failed);
    };

    run_in_chunks(suites, options_.parallel, task, collect);
    return all_results;
}

VariableContext build_suite_context(const Suite& suite, const std::optional<std::string>& env,
                                    const EnvironmentSource& source) {
    VariableContext context = VariableContext(source).with_env_vars().with_config_vars(suite.vars);
    if (env) {
        context.set("RIVET_ENV", *env);
    }
    return context;
}

VariableContext TestRunner::build_context(const Suite& suite, const std::optional<std::string>& env) const {
    return build_suite_context(suite, env, env_);
}

bool TestRunner::should_run(const std::string& step_name) const {
    if (!options_.filter) return true;
    return step_name.find(*options_.filter) != std::string::npos;
}

TestSuiteResult TestRunner::run_suite(const NamedSuite& named, const std::optional<std::string>& env,
                                      size_t parallel) const {
    const Suite& suite = named.second;
    auto suite_start = std::chrono::steady_clock::now();

    VariableContext context = build_context(suite, env);
    std::vector<TestResult> results;

    auto append = [&results](StepBatch&& batch) {
        results.insert(results.end(), std::make_move_iterator(batch.results.begin()),
                       std::make_move_iterator(batch.results.end()));
        return batch.halted;
    };

    bool halted = append(run_fixed_steps(suite.setup, "Setup: ", context));

    if (!halted) {
        if (suite.dataset) {
            std::vector<DataRow> rows;
            try {
                rows = load_csv_data(suite.dataset->file);
            } catch (const std::exception& e) {
                throw std::runtime_error("Failed to load dataset: " + suite.dataset->file + ": " + e.what());
            }
            size_t row_parallel = suite.dataset->parallel.value_or(parallel);
            spdlog::debug("Suite '{}': {} dataset row(s), parallel {}", suite.name, rows.size(), row_parallel);

            for (const auto& row : rows) {
                VariableContext row_context = context.with_data_row(row);
                if (append(run_test_steps(suite.tests, row_context, row_parallel))) break;
            }
        } else {
            append(run_test_steps(suite.tests, context, parallel));
        }
    }

    append(run_fixed_steps(suite.teardown, "Teardown: ", context));

    return TestSuiteResult::from(named.first, std::move(results), since(suite_start));
}

TestRunner::StepBatch TestRunner::run_fixed_steps(const std::optional<std::vector<Step>>& steps,
                                                  const std::string& prefix,
                                                  const VariableContext& context) const {
    StepBatch batch;
    if (!steps) return batch;

    for (const auto& step : *steps) {
        if (!should_run(step.name)) continue;

        TestResult result = execute_step(step, prefix + step.name, context);
        print_test_result(result);
        bool passed = result.passed;
        batch.results.push_back(std::move(result));

        if (options_.bail && !passed) {
            batch.halted = true;
            break;
        }
    }
    return batch;
}

TestRunner::StepBatch TestRunner::run_test_steps(const std::vector<Step>& steps,
                                                 const VariableContext& context,
                                                 size_t parallel) const {
    std::vector<const Step*> filtered;
    for (const auto& step : steps) {
        if (should_run(step.name)) filtered.push_back(&step);
    }

    StepBatch batch;

    if (parallel <= 1) {
        for (const Step* step : filtered) {
            TestResult result = execute_step(*step, step->name, context);
            print_test_result(result);
            bool passed = result.passed;
            batch.results.push_back(std::move(result));

            if (options_.bail && !passed) {
                batch.halted = true;
                break;
            }
        }
        return batch;
    }

    std::function<TestResult(const Step* const&)> task = [this, &context](const Step* const& step) {
        return execute_step(*step, step->name, context);
    };
    std::function<bool(TestResult&&)> collect = [this, &batch](TestResult&& result) {
        print_test_result(result);
        bool passed = result.passed;
        batch.results.push_back(std::move(result));
        if (options_.bail && !passed) {
            batch.halted = true;
            return false;
        }
        return true;
    };

    run_in_chunks(filtered, parallel, task, collect);
    return batch;
}

TestResult TestRunner::execute_step(const Step& step, const std::string& display_name,
                                    const VariableContext& context) const {
    return executor_.execute(display_name, step.request, step.expect, context);
}

void TestRunner::print_suite_start(const std::string& suite_name) const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (options_.ci) {
        out_ << "RUN " << suite_name << "\n";
    } else {
        out_ << "\n" << kCyan << "RUN" << kReset << " " << suite_name << "\n";
    }
    out_.flush();
}

void TestRunner::print_test_result(const TestResult& result) const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    const std::string took = format_duration(result.duration);

    if (options_.ci) {
        out_ << "  " << (result.passed ? "PASS " : "FAIL ") << result.name << " (" << took << ")\n";
        if (!result.passed && result.error) {
            out_ << "    Error: " << *result.error << "\n";
        }
    } else {
        if (result.passed) {
            out_ << "  " << kGreen << "✔" << kReset << " " << result.name << " (" << took << ")\n";
        } else {
            out_ << "  " << kRed << "✖" << kReset << " " << result.name << " (" << took << ")\n";
            if (result.error) {
                out_ << "    " << kRed << "Error" << kReset << ": " << *result.error << "\n";
            }
        }
    }
    out_.flush();
}

void TestRunner::print_suite_summary(const TestSuiteResult& suite) const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    const std::string took = format_duration(suite.duration);

    if (suite.failed == 0) {
        if (options_.ci) {
            out_ << "  PASS " << suite.passed << " tests in " << took << "\n";
        } else {
            out_ << "  " << kGreen << "✔" << kReset << " " << suite.passed << " tests passed in " << took << "\n";
        }
    } else {
        if (options_.ci) {
            out_ << "  FAIL " << suite.passed << " passed, " << suite.failed << " failed in " << took << "\n";
        } else {
            out_ << "  " << kRed << "✖" << kReset << " " << suite.passed << " passed, " << suite.failed
                 << " failed in " << took << "\n";
        }
    }
    out_.flush();
}

bool TestRunner::print_overall_summary(const std::vector<TestSuiteResult>& suites) const {
    size_t passed = 0;
    size_t failed = 0;
    std::chrono::nanoseconds total{0};
    for (const auto& suite : suites) {
        passed += suite.passed;
        failed += suite.failed;
        total += suite.duration;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    out_ << "\n";
    if (options_.ci) {
        out_ << (failed == 0 ? "PASSED" : "FAILED");
    } else {
        out_ << (failed == 0 ? kGreen : kRed) << (failed == 0 ? "PASSED" : "FAILED") << kReset;
    }
    out_ << "  " << suites.size() << " suite(s), " << passed << " passed, " << failed << " failed ("
         << format_duration(total) << ")\n";
    out_.flush();
    return failed == 0;
}
