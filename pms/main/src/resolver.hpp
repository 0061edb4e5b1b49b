#pragma once

#include "repository.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Package name -> pinned version, iterated in application order.
class ResolutionPlan {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    // Appends a new package, or repins one already in the plan in place.
    void add(const std::string& name, const std::string& version);
    bool erase(const std::string& name);

    bool contains(const std::string& name) const;
    std::optional<std::string> version_of(const std::string& name) const;

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    std::map<std::string, std::string> as_map() const;

private:
    std::vector<Entry> entries_;
};

// Depth-first transitive resolution with a single candidate per package and
// no backtracking. The index is only read.
class DependencyResolver {
public:
    explicit DependencyResolver(const RepositoryIndex& index);

    // Returns every package the root needs, root included, in dependency-first
    // order, followed by the already installed packages the pass left alone.
    // Throws UnknownPackage, UnsatisfiableDependency or CircularDependency.
    ResolutionPlan resolve(const std::string& name, const std::string& version,
                           const std::map<std::string, std::string>& already_installed) const;

private:
    void visit(const std::string& name, const std::string& version,
               const std::map<std::string, std::string>& already_installed,
               std::set<std::string>& active_path, ResolutionPlan& result) const;

    const RepositoryIndex& index_;
};
