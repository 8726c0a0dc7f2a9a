#include "load_controller.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

constexpr double kSpikeCycleSec = 30.0;
constexpr double kSpikeLengthSec = 5.0;

double seconds(std::chrono::nanoseconds d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace

LoadPattern parse_load_pattern(const std::string& text) {
    if (text == "constant") return LoadPattern::Constant;
    if (text == "ramp-up") return LoadPattern::RampUp;
    if (text == "spike") return LoadPattern::Spike;
    throw std::invalid_argument("Invalid load pattern '" + text + "'. Use: constant, ramp-up, spike");
}

std::string to_string(LoadPattern pattern) {
    switch (pattern) {
        case LoadPattern::Constant: return "constant";
        case LoadPattern::RampUp: return "ramp-up";
        case LoadPattern::Spike: return "spike";
    }
    return "constant";
}

LoadController::LoadController(LoadPattern pattern, std::optional<unsigned> target_rps,
                               unsigned concurrent_users, std::chrono::milliseconds warmup)
    : pattern_(pattern),
      target_rps_(target_rps),
      concurrent_users_(concurrent_users),
      warmup_(warmup),
      start_(Clock::now()) {}

double LoadController::base_rps() const {
    return static_cast<double>(target_rps_.value_or(concurrent_users_ * 10));
}

std::optional<double> LoadController::ramp_progress(std::chrono::nanoseconds elapsed) const {
    if (elapsed >= warmup_) return std::nullopt;
    return seconds(elapsed) / seconds(warmup_);
}

double LoadController::spike_cycle_position(std::chrono::nanoseconds elapsed) {
    return std::fmod(seconds(elapsed), kSpikeCycleSec);
}

double LoadController::target_rps_at(std::chrono::nanoseconds elapsed) const {
    const double base = base_rps();

    switch (pattern_) {
        case LoadPattern::Constant:
            return base;
        case LoadPattern::RampUp: {
            auto progress = ramp_progress(elapsed);
            return progress ? base * *progress : base;
        }
        case LoadPattern::Spike:
            return spike_cycle_position(elapsed) < kSpikeLengthSec ? base * 2.0 : base;
    }
    return base;
}

unsigned LoadController::concurrent_users_at(std::chrono::nanoseconds elapsed) const {
    switch (pattern_) {
        case LoadPattern::Constant:
            return concurrent_users_;
        case LoadPattern::RampUp: {
            auto progress = ramp_progress(elapsed);
            if (!progress) return concurrent_users_;
            return static_cast<unsigned>(std::max(1.0, concurrent_users_ * *progress));
        }
        case LoadPattern::Spike:
            return spike_cycle_position(elapsed) < kSpikeLengthSec ? concurrent_users_ * 2 : concurrent_users_;
    }
    return concurrent_users_;
}

std::optional<std::chrono::milliseconds> LoadController::delay_at(std::chrono::nanoseconds elapsed) const {
    if (!target_rps_) return std::nullopt;

    // At the very start of a ramp the rate is ~0; cap the pause at one second.
    const double rps = std::max(1.0, target_rps_at(elapsed));
    return std::chrono::milliseconds(static_cast<long long>(1000.0 / rps));
}

std::string LoadController::phase_description_at(std::chrono::nanoseconds elapsed) const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);

    switch (pattern_) {
        case LoadPattern::Constant:
            return "Constant load";
        case LoadPattern::RampUp: {
            auto progress = ramp_progress(elapsed);
            if (!progress) return "Full load";
            ss << "Ramping up (" << static_cast<unsigned>(*progress * 100.0) << "%)";
            return ss.str();
        }
        case LoadPattern::Spike: {
            const double pos = spike_cycle_position(elapsed);
            if (pos < kSpikeLengthSec) {
                ss << "Spike phase (" << kSpikeLengthSec - pos << "s remaining)";
            } else {
                ss << "Normal phase (" << kSpikeCycleSec - pos << "s to spike)";
            }
            return ss.str();
        }
    }
    return "Constant load";
}
