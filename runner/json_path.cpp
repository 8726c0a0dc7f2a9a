#include "json_path.hpp"
#include "variable_context.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>

using json = nlohmann::json;

namespace {

std::optional<size_t> parse_index(const std::string& text) {
    if (text.empty()) return std::nullopt;

    size_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        size_t digit = static_cast<size_t>(c - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

std::optional<int64_t> parse_int64(const std::string& text) {
    size_t pos = 0;
    bool negative = false;
    if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos >= text.size()) return std::nullopt;

    // Accumulate as a negative number so INT64_MIN round-trips.
    int64_t value = 0;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        int digit = c - '0';
        if (value < (std::numeric_limits<int64_t>::min() + digit) / 10) return std::nullopt;
        value = value * 10 - digit;
    }
    if (!negative) {
        if (value == std::numeric_limits<int64_t>::min()) return std::nullopt;
        value = -value;
    }
    return value;
}

const json& index_into(const json& current, const std::string& index_text) {
    auto index = parse_index(index_text);
    if (!index) {
        throw JsonPathError("Invalid array index: " + index_text);
    }
    if (!current.is_array() || *index >= current.size()) {
        throw JsonPathError("Array index " + std::to_string(*index) + " not found");
    }
    return current[*index];
}

const json& field_of(const json& current, const std::string& field) {
    if (!current.is_object()) {
        throw JsonPathError("Field '" + field + "' not found in JSON");
    }
    auto it = current.find(field);
    if (it == current.end()) {
        throw JsonPathError("Field '" + field + "' not found in JSON");
    }
    return *it;
}

const json& resolve(const json& document, const std::string& path) {
    const json* current = &document;

    // Root array access: "$[0]" or "$[0].rest"
    if (path.rfind("$[", 0) == 0) {
        auto bracket_end = path.find(']');
        if (bracket_end != std::string::npos) {
            current = &index_into(*current, path.substr(2, bracket_end - 2));

            std::string rest = path.substr(bracket_end + 1);
            if (rest.empty()) return *current;
            if (rest[0] != '.') {
                throw JsonPathError("Unsupported JSONPath syntax: " + path);
            }
            return resolve(*current, rest.substr(1));
        }
    }

    std::string remaining = path.rfind("$.", 0) == 0 ? path.substr(2) : path;

    size_t start = 0;
    while (start <= remaining.size()) {
        size_t dot = remaining.find('.', start);
        if (dot == std::string::npos) dot = remaining.size();
        std::string part = remaining.substr(start, dot - start);
        start = dot + 1;

        if (part.empty()) continue;

        auto open = part.find('[');
        if (open != std::string::npos && part.back() == ']') {
            std::string field = part.substr(0, open);
            std::string index_text = part.substr(open + 1, part.size() - open - 2);

            if (!field.empty()) {
                current = &field_of(*current, field);
            }
            current = &index_into(*current, index_text);
        } else {
            current = &field_of(*current, part);
        }
    }

    return *current;
}

} // namespace

json extract_json_path(const json& document, const std::string& path) {
    return resolve(document, path);
}

json coerce_expected(const json& expected, const VariableContext& context) {
    if (!expected.is_string()) return expected;

    std::string substituted = context.substitute(expected.get<std::string>());

    if (auto number = parse_int64(substituted)) return json(*number);
    if (substituted == "true") return json(true);
    if (substituted == "false") return json(false);
    return json(substituted);
}

void assert_json_path(const json& document, const std::string& path,
                      const json& expected, const VariableContext& context) {
    json actual = extract_json_path(document, path);
    json wanted = coerce_expected(expected, context);

    if (actual != wanted) {
        throw JsonPathError("JSONPath assertion failed for '" + path + "': expected " +
                            wanted.dump() + " but got " + actual.dump());
    }
}
