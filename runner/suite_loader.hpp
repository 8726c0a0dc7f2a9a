#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "suite.h"

/**
 * @brief Loads suites from a file or a directory.
 *
 * A file yields a single (file name, suite) pair. A directory is walked
 * recursively for "*.rivet.yaml" / "*.rivet.yml" files, returned sorted by
 * file name. Throws std::runtime_error on missing paths, unreadable files,
 * malformed documents and directories with no suite files.
 */
std::vector<NamedSuite> load_test_suites(const std::filesystem::path& target);

// Parses one suite document. Throws std::runtime_error with a parse detail.
Suite parse_suite(const std::string& document);
