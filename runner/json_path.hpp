#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class VariableContext;

// Thrown for any path that is malformed or does not resolve.
class JsonPathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Resolves the supported JSONPath subset against a document.
 *
 * Supported forms:
 *   $.a.b          object field access
 *   $.items[0].id  field-qualified array index
 *   $[0].field     root-level array index
 *
 * Leading "$." is optional. Throws JsonPathError naming the field or
 * index that failed.
 */
nlohmann::json extract_json_path(const nlohmann::json& document, const std::string& path);

/**
 * @brief Prepares an expected value for comparison.
 *
 * Strings are substituted through the context, then coerced: a value
 * that parses fully as a 64-bit integer becomes a number, "true"/"false"
 * become booleans, anything else stays a string. Non-string values are
 * returned unchanged.
 */
nlohmann::json coerce_expected(const nlohmann::json& expected, const VariableContext& context);

/**
 * @brief Evaluates one assertion; throws on the first mismatch.
 */
void assert_json_path(const nlohmann::json& document, const std::string& path,
                      const nlohmann::json& expected, const VariableContext& context);
