#include "utils.h"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

// Leaves headroom for steady_clock::now() + d in nanoseconds.
constexpr long long kMaxDurationMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds::max()).count() / 2;

} // namespace

std::chrono::milliseconds parse_duration(const std::string& text) {
    size_t digits = 0;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) digits++;

    const std::string number = text.substr(0, digits);
    const std::string unit = text.substr(digits);
    if (number.empty() || number.size() > 12) {
        throw std::invalid_argument("Invalid duration format: " + text);
    }

    long long millis_per_unit = 0;
    if (unit == "ms") millis_per_unit = 1;
    else if (unit == "s" || unit.empty()) millis_per_unit = 1000;
    else if (unit == "m") millis_per_unit = 60000;
    else throw std::invalid_argument("Invalid duration format: " + text);

    const long long value = std::stoll(number);
    if (value > kMaxDurationMs / millis_per_unit) {
        throw std::invalid_argument("Invalid duration format: " + text);
    }
    return std::chrono::milliseconds(value * millis_per_unit);
}

std::string format_duration(std::chrono::nanoseconds d) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);

    const auto ns = d.count();
    if (ns < 1000000) {
        ss << std::setprecision(0) << (static_cast<double>(ns) / 1e3) << "us";
    } else if (ns < 1000000000) {
        ss << (static_cast<double>(ns) / 1e6) << "ms";
    } else {
        ss << (static_cast<double>(ns) / 1e9) << "s";
    }
    return ss.str();
}

std::string format_percent(double ratio) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << ratio * 100.0 << "%";
    return ss.str();
}

void write_json_file(const nlohmann::json& doc, const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.good()) {
        throw std::runtime_error("Failed to open '" + path + "' for writing");
    }
    out << doc.dump(2) << "\n";
    if (!out.good()) {
        throw std::runtime_error("Failed to write '" + path + "'");
    }
}
