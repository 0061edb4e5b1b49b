#include "resolver.hpp"

#include "dependency.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "version.hpp"

#include <algorithm>

void ResolutionPlan::add(const std::string& name, const std::string& version) {
    auto it = std::ranges::find(entries_, name, &Entry::first);
    if (it != entries_.end()) {
        it->second = version;
        return;
    }
    entries_.emplace_back(name, version);
}

bool ResolutionPlan::erase(const std::string& name) {
    return std::erase_if(entries_, [&](const Entry& e) { return e.first == name; }) > 0;
}

bool ResolutionPlan::contains(const std::string& name) const {
    return std::ranges::find(entries_, name, &Entry::first) != entries_.end();
}

std::optional<std::string> ResolutionPlan::version_of(const std::string& name) const {
    auto it = std::ranges::find(entries_, name, &Entry::first);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, std::string> ResolutionPlan::as_map() const {
    return std::map<std::string, std::string>(entries_.begin(), entries_.end());
}

DependencyResolver::DependencyResolver(const RepositoryIndex& index) : index_(index) {}

ResolutionPlan DependencyResolver::resolve(const std::string& name, const std::string& version,
                                           const std::map<std::string, std::string>& already_installed) const {
    std::set<std::string> active_path;
    ResolutionPlan result;
    visit(name, version, already_installed, active_path, result);

    for (const auto& [installed_name, installed_version] : already_installed) {
        if (!result.contains(installed_name)) {
            result.add(installed_name, installed_version);
        }
    }
    return result;
}

void DependencyResolver::visit(const std::string& name, const std::string& version,
                               const std::map<std::string, std::string>& already_installed,
                               std::set<std::string>& active_path, ResolutionPlan& result) const {
    const PackageMetadata& metadata = index_.metadata_for(name, version);

    if (active_path.contains(name)) {
        throw CircularDependency(name, string_format("error.circular_dependency", name));
    }
    active_path.insert(name);

    for (const auto& declaration : metadata.dependencies) {
        const DependencySpec dep = parse_dependency_spec(declaration);

        const auto pinned = result.version_of(dep.name);
        std::optional<std::string> present = pinned;
        if (!present) {
            if (auto it = already_installed.find(dep.name); it != already_installed.end()) {
                present = it->second;
            }
        }

        if (present && (!dep.constraint || version_satisfies(*present, dep.constraint->op, dep.constraint->version))) {
            continue;
        }
        if (pinned) {
            throw UnsatisfiableDependency(string_format("error.dependency_conflict", dep.name, *pinned, to_string(dep)));
        }

        std::string candidate;
        if (dep.constraint) {
            candidate = index_.latest_satisfying(dep.name, dep.constraint->op, dep.constraint->version);
        } else {
            candidate = index_.latest_satisfying(dep.name, "=", std::nullopt);
        }
        visit(dep.name, candidate, already_installed, active_path, result);
    }

    active_path.erase(name);
    result.add(name, version);
}
