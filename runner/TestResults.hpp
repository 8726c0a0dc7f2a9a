#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Outcome of one step execution. Produced once, never modified.
struct TestResult {
    std::string name;
    bool passed = false;
    std::chrono::nanoseconds duration{0};
    std::optional<std::string> error;
    std::optional<int> response_status;      // empty for transport failures
    std::optional<std::string> response_body;
};

// Invariant: passed + failed == results.size()
struct TestSuiteResult {
    std::string name;
    std::vector<TestResult> results;
    std::chrono::nanoseconds duration{0};
    size_t passed = 0;
    size_t failed = 0;

    static TestSuiteResult from(std::string name, std::vector<TestResult> results,
                                std::chrono::nanoseconds duration) {
        TestSuiteResult suite{std::move(name), std::move(results), duration, 0, 0};
        for (const auto& r : suite.results) {
            if (r.passed) suite.passed++;
            else suite.failed++;
        }
        return suite;
    }
};
