#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

#include "suite.h"

/**
 * @brief Read-only view of the process environment.
 *
 * Passed into VariableContext explicitly so substitution can be driven
 * by a fixed map in tests instead of the real environment.
 */
class EnvironmentSource {
public:
    using Lookup = std::function<std::optional<std::string>(const std::string&)>;
    using Snapshot = std::function<std::unordered_map<std::string, std::string>()>;

    EnvironmentSource(Lookup lookup, Snapshot snapshot)
        : lookup_(std::move(lookup)), snapshot_(std::move(snapshot)) {}

    // Backed by getenv()/environ.
    static EnvironmentSource process();

    // Backed by a fixed map; nothing else is visible.
    static EnvironmentSource fixed(std::unordered_map<std::string, std::string> values);

    std::optional<std::string> get(const std::string& name) const { return lookup_(name); }
    std::unordered_map<std::string, std::string> all() const { return snapshot_(); }

private:
    Lookup lookup_;
    Snapshot snapshot_;
};

/**
 * @brief Per-run template store.
 *
 * substitute() expands "{{name}}" from the bindings (unbound names are left
 * verbatim), then expands "${NAME:default}" from the environment, the
 * bindings, then the default, in that order. The {{}} pass always runs
 * first, so a binding may expand into a ${} pattern but not the reverse.
 *
 * Copies are fully independent; builders return a new context.
 */
class VariableContext {
public:
    VariableContext();
    explicit VariableContext(EnvironmentSource env);

    // Seeds every environment variable as a binding.
    VariableContext with_env_vars() const;

    // Each value is substituted against the context built so far, in
    // declaration order, so later entries can reference earlier ones.
    VariableContext with_config_vars(const std::optional<VarList>& vars) const;

    VariableContext with_data_row(const std::map<std::string, std::string>& row) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    size_t size() const { return vars_.size(); }

    std::string substitute(const std::string& text) const;

private:
    std::string substitute_vars(const std::string& text) const;
    std::string substitute_env(const std::string& text) const;

    EnvironmentSource env_;
    std::unordered_map<std::string, std::string> vars_;
};
