#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

/**
 * @brief Declarative suite model shared by the test runner and the
 * performance runner.
 *
 * A Suite is loaded once and never mutated afterwards. Workers that need
 * their own copy take one by value.
 */

// Suite vars in declaration order; later entries may reference earlier ones.
using VarList = std::vector<std::pair<std::string, std::string>>;

// Either a literal code (200) or a template string ("{{expected}}").
using StatusExpectation = std::variant<int, std::string>;

struct Request {
    std::string method;
    std::string url;
    std::optional<std::map<std::string, std::string>> headers;
    std::optional<std::map<std::string, std::string>> params;
    std::optional<std::string> body;
};

struct Expectation {
    std::optional<StatusExpectation> status;
    std::optional<std::string> schema;                      // carried, not evaluated
    std::optional<std::map<std::string, nlohmann::json>> jsonpath;
    std::optional<std::map<std::string, std::string>> headers;  // carried, not evaluated
};

struct Step {
    std::string name;
    std::optional<std::string> description;
    Request request;
    std::optional<Expectation> expect;
};

struct Dataset {
    std::string file;
    std::optional<size_t> parallel;
};

struct Suite {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> env;
    std::optional<VarList> vars;
    std::optional<std::vector<Step>> setup;
    std::vector<Step> tests;
    std::optional<Dataset> dataset;
    std::optional<std::vector<Step>> teardown;
};

// (file name, suite) as produced by the suite loader.
using NamedSuite = std::pair<std::string, Suite>;
