#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Snapshot of a performance run. Durations serialize as whole milliseconds.
struct PerformanceResults {
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    uint64_t failed_requests = 0;
    double success_rate = 0.0;
    double requests_per_second = 0.0;

    std::chrono::nanoseconds average_response_time{0};
    std::chrono::nanoseconds min_response_time{0};
    std::chrono::nanoseconds max_response_time{0};
    std::chrono::nanoseconds p50_response_time{0};
    std::chrono::nanoseconds p95_response_time{0};
    std::chrono::nanoseconds p99_response_time{0};

    std::map<int, uint64_t> status_code_distribution;
    double bytes_per_second_sent = 0.0;
    double bytes_per_second_received = 0.0;
    uint64_t connection_errors = 0;

    std::chrono::nanoseconds total_duration{0};

    nlohmann::json to_json() const;
    void save_report(const std::string& path) const;
};

/**
 * @brief Thread-safe aggregate of request outcomes.
 *
 * Every worker records into the same instance; each call takes the one
 * internal lock, so snapshots never observe a half-recorded request.
 */
class PerformanceMetrics {
public:
    PerformanceMetrics();

    void record_request(std::chrono::nanoseconds response_time, int status_code,
                        uint64_t bytes_sent, uint64_t bytes_received, bool is_error);

    // No response at all; counts as a request and as an error.
    void record_connection_error();

    // Adds other's samples and counters into this aggregate.
    void merge(const PerformanceMetrics& other);

    PerformanceResults calculate_results() const;

private:
    struct Samples {
        std::vector<std::chrono::nanoseconds> response_times;
        uint64_t error_count = 0;
        uint64_t request_count = 0;
        std::map<int, uint64_t> status_codes;
        uint64_t bytes_sent = 0;
        uint64_t bytes_received = 0;
        uint64_t connection_errors = 0;
    };

    Samples copy() const;

    std::chrono::steady_clock::time_point start_time_;
    mutable std::mutex mutex_;
    Samples samples_;
};
