#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

struct VersionConstraint {
    std::string op;      // "=", ">", "<", ">=" or "<="
    std::string version;
};

struct DependencySpec {
    std::string name;
    std::optional<VersionConstraint> constraint; // empty: any version, prefer the latest
};

// "name (op version)" -> {"name", "(op version)"}; the clause is empty when absent.
std::pair<std::string, std::optional<std::string>> parse_dependency(const std::string& declaration);

// "(op version)" -> {op, version}. A missing clause, or one without a space,
// yields {"=", nullopt}, meaning unconstrained.
std::pair<std::string, std::optional<std::string>> parse_version_clause(const std::optional<std::string>& clause);

DependencySpec parse_dependency_spec(const std::string& declaration);

// True when `installed` holds the dependency at a version meeting its constraint.
bool is_dependency_satisfied(const DependencySpec& dep, const std::map<std::string, std::string>& installed);

std::string to_string(const DependencySpec& dep);
