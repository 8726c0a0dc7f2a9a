#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

using DataRow = std::map<std::string, std::string>;

/**
 * @brief Reads a CSV file with a header row into rows keyed by header.
 *
 * Quoted fields may contain separators, doubled quotes and line breaks.
 * Blank lines are skipped. Rows come back in file order.
 */
std::vector<DataRow> load_csv_data(const std::filesystem::path& file);

std::vector<DataRow> parse_csv(const std::string& content);
