#pragma once

#include <chrono>
#include <optional>
#include <string>

enum class LoadPattern {
    Constant,   // same rate for the whole run
    RampUp,     // 0 -> base over the warm-up window
    Spike,      // 2x base for the first 5s of every 30s
};

// "constant", "ramp-up" or "spike". Throws std::invalid_argument otherwise.
LoadPattern parse_load_pattern(const std::string& text);
std::string to_string(LoadPattern pattern);

/**
 * @brief Shapes the request rate of a performance run over time.
 *
 * Every query is a pure function of the time elapsed since construction;
 * the *_at() overloads take that elapsed time explicitly.
 */
class LoadController {
public:
    using Clock = std::chrono::steady_clock;

    LoadController(LoadPattern pattern, std::optional<unsigned> target_rps,
                   unsigned concurrent_users, std::chrono::milliseconds warmup);

    // target_rps if given, else concurrent_users * 10.
    double base_rps() const;

    double current_target_rps() const { return target_rps_at(elapsed()); }
    double target_rps_at(std::chrono::nanoseconds elapsed) const;

    unsigned current_concurrent_users() const { return concurrent_users_at(elapsed()); }
    unsigned concurrent_users_at(std::chrono::nanoseconds elapsed) const;

    // Pause after each request. Empty unless an explicit target rate was set.
    std::optional<std::chrono::milliseconds> request_delay() const { return delay_at(elapsed()); }
    std::optional<std::chrono::milliseconds> delay_at(std::chrono::nanoseconds elapsed) const;

    std::string current_phase_description() const { return phase_description_at(elapsed()); }
    std::string phase_description_at(std::chrono::nanoseconds elapsed) const;

    LoadPattern pattern() const { return pattern_; }

private:
    std::chrono::nanoseconds elapsed() const { return Clock::now() - start_; }

    // Fraction of the warm-up window covered, or nullopt once past it.
    std::optional<double> ramp_progress(std::chrono::nanoseconds elapsed) const;
    static double spike_cycle_position(std::chrono::nanoseconds elapsed);

    LoadPattern pattern_;
    std::optional<unsigned> target_rps_;
    unsigned concurrent_users_;
    std::chrono::milliseconds warmup_;
    Clock::time_point start_;
};
