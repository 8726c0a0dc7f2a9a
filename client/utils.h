#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

// "250ms", "30s", "2m", or bare seconds ("45").
// Throws std::invalid_argument("Invalid duration format: ...").
std::chrono::milliseconds parse_duration(const std::string& text);

// "850us", "12.34ms", "3.21s"
std::string format_duration(std::chrono::nanoseconds d);

std::string format_percent(double ratio);

// Writes doc as pretty JSON, replacing any existing file.
void write_json_file(const nlohmann::json& doc, const std::string& path);
