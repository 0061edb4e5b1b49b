#include "dependency.hpp"
#include "version.hpp"

#include <algorithm>
#include <string_view>

namespace {

constexpr std::string_view WHITESPACE = " \t";

std::string trim(std::string_view sv) {
    const auto first = sv.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) return "";
    const auto last = sv.find_last_not_of(WHITESPACE);
    return std::string(sv.substr(first, last - first + 1));
}

} // anonymous namespace

std::pair<std::string, std::optional<std::string>> parse_dependency(const std::string& declaration) {
    const std::string decl = trim(declaration);
    const auto pos = decl.find_first_of(WHITESPACE);
    if (pos == std::string::npos) {
        return {decl, std::nullopt};
    }
    std::string clause = trim(std::string_view(decl).substr(pos + 1));
    if (clause.empty()) return {decl.substr(0, pos), std::nullopt};
    return {decl.substr(0, pos), std::move(clause)};
}

std::pair<std::string, std::optional<std::string>> parse_version_clause(const std::optional<std::string>& clause) {
    if (!clause) return {"=", std::nullopt};

    std::string stripped = *clause;
    std::erase_if(stripped, [](char c) { return c == '(' || c == ')'; });
    stripped = trim(stripped);

    const auto pos = stripped.find_first_of(WHITESPACE);
    if (pos == std::string::npos) return {"=", std::nullopt};

    std::string op = stripped.substr(0, pos);
    std::string version = trim(std::string_view(stripped).substr(pos + 1));
    if (version.empty()) return {"=", std::nullopt};
    return {std::move(op), std::move(version)};
}

DependencySpec parse_dependency_spec(const std::string& declaration) {
    auto [name, clause] = parse_dependency(declaration);
    auto [op, version] = parse_version_clause(clause);

    DependencySpec spec{.name = std::move(name), .constraint = std::nullopt};
    if (version) {
        spec.constraint = VersionConstraint{.op = std::move(op), .version = std::move(*version)};
    }
    return spec;
}

bool is_dependency_satisfied(const DependencySpec& dep, const std::map<std::string, std::string>& installed) {
    const auto it = installed.find(dep.name);
    if (it == installed.end()) return false;
    if (!dep.constraint) return true;
    return version_satisfies(it->second, dep.constraint->op, dep.constraint->version);
}

std::string to_string(const DependencySpec& dep) {
    if (!dep.constraint) return dep.name;
    return dep.name + " (" + dep.constraint->op + " " + dep.constraint->version + ")";
}
