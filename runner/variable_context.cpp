#include "variable_context.hpp"

#include <cstdlib>
#include <iterator>
#include <memory>
#include <regex>

extern char** environ;

namespace {

const std::regex& var_pattern() {
    static const std::regex re(R"(\{\{(\w+)\}\})");
    return re;
}

const std::regex& env_pattern() {
    static const std::regex re(R"(\$\{([^:}]+)(?::([^}]*))?\})");
    return re;
}

// Rebuilds text, replacing each match with replace(match).
template <typename Fn>
std::string replace_all(const std::string& text, const std::regex& re, Fn replace) {
    std::string out;
    out.reserve(text.size());

    auto last = text.cbegin();
    for (std::sregex_iterator it(text.cbegin(), text.cend(), re), end; it != end; ++it) {
        const std::smatch& m = *it;
        out.append(last, m[0].first);
        out += replace(m);
        last = m[0].second;
    }
    out.append(last, text.cend());
    return out;
}

} // namespace

EnvironmentSource EnvironmentSource::process() {
    return EnvironmentSource(
        [](const std::string& name) -> std::optional<std::string> {
            const char* value = std::getenv(name.c_str());
            if (value == nullptr) return std::nullopt;
            return std::string(value);
        },
        [] {
            std::unordered_map<std::string, std::string> all;
            for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
                std::string kv(*entry);
                auto eq = kv.find('=');
                if (eq == std::string::npos) continue;
                all[kv.substr(0, eq)] = kv.substr(eq + 1);
            }
            return all;
        });
}

EnvironmentSource EnvironmentSource::fixed(std::unordered_map<std::string, std::string> values) {
    auto shared = std::make_shared<const std::unordered_map<std::string, std::string>>(std::move(values));
    return EnvironmentSource(
        [shared](const std::string& name) -> std::optional<std::string> {
            auto it = shared->find(name);
            if (it == shared->end()) return std::nullopt;
            return it->second;
        },
        [shared] { return *shared; });
}

VariableContext::VariableContext() : env_(EnvironmentSource::process()) {}

VariableContext::VariableContext(EnvironmentSource env) : env_(std::move(env)) {}

VariableContext VariableContext::with_env_vars() const {
    VariableContext next(*this);
    for (auto& [key, value] : env_.all()) {
        next.vars_[key] = value;
    }
    return next;
}

VariableContext VariableContext::with_config_vars(const std::optional<VarList>& vars) const {
    VariableContext next(*this);
    if (!vars) return next;

    for (const auto& [key, value] : *vars) {
        next.vars_[key] = next.substitute(value);
    }
    return next;
}

VariableContext VariableContext::with_data_row(const std::map<std::string, std::string>& row) const {
    VariableContext next(*this);
    for (const auto& [key, value] : row) {
        next.vars_[key] = value;
    }
    return next;
}

void VariableContext::set(const std::string& key, const std::string& value) {
    vars_[key] = value;
}

std::optional<std::string> VariableContext::get(const std::string& key) const {
    auto it = vars_.find(key);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

std::string VariableContext::substitute(const std::string& text) const {
    // Order matters: {{var}} expansions may produce ${ENV} patterns.
    return substitute_env(substitute_vars(text));
}

std::string VariableContext::substitute_vars(const std::string& text) const {
    if (text.find("{{") == std::string::npos) return text;

    return replace_all(text, var_pattern(), [this](const std::smatch& m) {
        auto it = vars_.find(m[1].str());
        return it != vars_.end() ? it->second : m[0].str();
    });
}

std::string VariableContext::substitute_env(const std::string& text) const {
    if (text.find("${") == std::string::npos) return text;

    return replace_all(text, env_pattern(), [this](const std::smatch& m) {
        const std::string name = m[1].str();
        if (auto value = env_.get(name)) return *value;

        auto it = vars_.find(name);
        if (it != vars_.end()) return it->second;

        return m[2].matched ? m[2].str() : std::string();
    });
}
