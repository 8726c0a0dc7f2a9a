#pragma once

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "load_controller.hpp"
#include "performance_metrics.hpp"

/**
 * @brief Console reporting for a performance run: periodic progress blocks
 * and the final summary.
 */
class PerformanceMonitor {
public:
    PerformanceMonitor(std::chrono::milliseconds target_duration, std::ostream& out = std::cout);

    void print_progress_report(const PerformanceResults& results, const LoadController& controller) const;
    void print_final_summary(const PerformanceResults& results) const;

    // One "<metric>: <grade>" line per assessed metric.
    static std::vector<std::string> assess(const PerformanceResults& results);

private:
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::milliseconds target_duration_;
    std::ostream& out_;
};
