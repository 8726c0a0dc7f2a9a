#include "suite_loader.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string required_string(const YAML::Node& node, const char* key, const std::string& where) {
    YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        throw std::runtime_error(where + ": missing field '" + key + "'");
    }
    if (!value.IsScalar()) {
        throw std::runtime_error(where + ": field '" + key + "' must be a string");
    }
    return value.as<std::string>();
}

std::optional<std::string> optional_string(const YAML::Node& node, const char* key) {
    YAML::Node value = node[key];
    if (!value || value.IsNull()) return std::nullopt;
    return value.as<std::string>();
}

std::optional<std::map<std::string, std::string>> optional_map(const YAML::Node& node, const char* key) {
    YAML::Node value = node[key];
    if (!value || value.IsNull()) return std::nullopt;
    if (!value.IsMap()) {
        throw std::runtime_error(std::string("field '") + key + "' must be a mapping");
    }
    std::map<std::string, std::string> out;
    for (const auto& entry : value) {
        out[entry.first.as<std::string>()] = entry.second.as<std::string>();
    }
    return out;
}

// Keeps document order, which yaml-cpp preserves when iterating a map.
std::optional<VarList> optional_var_list(const YAML::Node& node, const char* key) {
    YAML::Node value = node[key];
    if (!value || value.IsNull()) return std::nullopt;
    if (!value.IsMap()) {
        throw std::runtime_error(std::string("field '") + key + "' must be a mapping");
    }
    VarList out;
    for (const auto& entry : value) {
        out.emplace_back(entry.first.as<std::string>(), entry.second.as<std::string>());
    }
    return out;
}

// Plain scalars get YAML typing; quoted scalars stay strings.
json to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar: {
            if (node.Tag() == "!") return node.as<std::string>();

            const std::string& text = node.Scalar();
            if (text == "~" || text == "null" || text == "Null" || text == "NULL") return nullptr;

            if (text == "true" || text == "True" || text == "TRUE") return true;
            if (text == "false" || text == "False" || text == "FALSE") return false;

            int64_t i;
            if (YAML::convert<int64_t>::decode(node, i)) return i;

            double d;
            if (YAML::convert<double>::decode(node, d)) return d;

            return text;
        }
        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) arr.push_back(to_json(item));
            return arr;
        }
        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& entry : node) obj[entry.first.as<std::string>()] = to_json(entry.second);
            return obj;
        }
    }
    return nullptr;
}

Expectation parse_expectation(const YAML::Node& node) {
    Expectation expect;

    YAML::Node status = node["status"];
    if (status && !status.IsNull()) {
        int code;
        if (status.Tag() != "!" && YAML::convert<int>::decode(status, code)) {
            expect.status = code;
        } else {
            expect.status = status.as<std::string>();
        }
    }

    expect.schema = optional_string(node, "schema");
    expect.headers = optional_map(node, "headers");

    YAML::Node jsonpath = node["jsonpath"];
    if (jsonpath && !jsonpath.IsNull()) {
        if (!jsonpath.IsMap()) {
            throw std::runtime_error("field 'jsonpath' must be a mapping");
        }
        std::map<std::string, json> assertions;
        for (const auto& entry : jsonpath) {
            assertions[entry.first.as<std::string>()] = to_json(entry.second);
        }
        expect.jsonpath = std::move(assertions);
    }
    return expect;
}

Step parse_step(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        throw std::runtime_error(where + ": step must be a mapping");
    }

    Step step;
    step.name = required_string(node, "name", where);
    step.description = optional_string(node, "description");

    YAML::Node request = node["request"];
    if (!request || !request.IsMap()) {
        throw std::runtime_error(where + " '" + step.name + "': missing field 'request'");
    }
    step.request.method = required_string(request, "method", step.name);
    step.request.url = required_string(request, "url", step.name);
    step.request.headers = optional_map(request, "headers");
    step.request.params = optional_map(request, "params");
    step.request.body = optional_string(request, "body");

    YAML::Node expect = node["expect"];
    if (expect && !expect.IsNull()) {
        step.expect = parse_expectation(expect);
    }
    return step;
}

std::optional<std::vector<Step>> optional_steps(const YAML::Node& node, const char* key) {
    YAML::Node value = node[key];
    if (!value || value.IsNull()) return std::nullopt;
    if (!value.IsSequence()) {
        throw std::runtime_error(std::string("field '") + key + "' must be a sequence");
    }
    std::vector<Step> steps;
    for (size_t i = 0; i < value.size(); ++i) {
        steps.push_back(parse_step(value[i], std::string(key) + "[" + std::to_string(i) + "]"));
    }
    return steps;
}

bool is_suite_file(const fs::path& path) {
    auto ext = path.extension().string();
    if (ext != ".yaml" && ext != ".yml") return false;
    return path.filename().string().find(".rivet.") != std::string::npos;
}

Suite load_single_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in.good()) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        return parse_suite(buffer.str());
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to parse YAML in file: " + path.string() + ": " + e.what());
    }
}

} // namespace

Suite parse_suite(const std::string& document) {
    YAML::Node root = YAML::Load(document);
    if (!root.IsMap()) {
        throw std::runtime_error("suite document must be a mapping");
    }

    Suite suite;
    suite.name = required_string(root, "name", "suite");
    suite.description = optional_string(root, "description");
    suite.env = optional_string(root, "env");
    suite.vars = optional_var_list(root, "vars");
    suite.setup = optional_steps(root, "setup");
    suite.teardown = optional_steps(root, "teardown");

    auto tests = optional_steps(root, "tests");
    if (!tests) {
        throw std::runtime_error("suite: missing field 'tests'");
    }
    suite.tests = std::move(*tests);

    YAML::Node dataset = root["dataset"];
    if (dataset && !dataset.IsNull()) {
        Dataset ds;
        ds.file = required_string(dataset, "file", "dataset");
        YAML::Node parallel = dataset["parallel"];
        if (parallel && !parallel.IsNull()) {
            ds.parallel = parallel.as<size_t>();
        }
        suite.dataset = std::move(ds);
    }
    return suite;
}

std::vector<NamedSuite> load_test_suites(const fs::path& target) {
    std::error_code ec;

    if (fs::is_regular_file(target, ec)) {
        spdlog::debug("Loading suite file {}", target.string());
        return {{target.filename().string(), load_single_file(target)}};
    }

    if (!fs::is_directory(target, ec)) {
        throw std::runtime_error("Path does not exist: " + target.string());
    }

    std::vector<NamedSuite> suites;
    for (fs::recursive_directory_iterator it(target, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec) || !is_suite_file(it->path())) continue;
        spdlog::debug("Loading suite file {}", it->path().string());
        suites.emplace_back(it->path().filename().string(), load_single_file(it->path()));
    }
    if (ec) {
        throw std::runtime_error("Failed to read directory: " + target.string() + ": " + ec.message());
    }

    if (suites.empty()) {
        throw std::runtime_error("No .rivet.yaml files found in directory: " + target.string());
    }

    std::stable_sort(suites.begin(), suites.end(),
                     [](const NamedSuite& a, const NamedSuite& b) { return a.first < b.first; });

    spdlog::info("Loaded {} suite(s) from {}", suites.size(), target.string());
    return suites;
}
