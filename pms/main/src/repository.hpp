#pragma once

#include "config.hpp"
#include "metadata.hpp"
#include "version.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

// In-memory view of every package offered by the configured sources:
// name -> version -> metadata. Read-only while a resolution is running.
class RepositoryIndex {
public:
    using VersionMap = std::map<std::string, PackageMetadata, VersionLess>;

    void add(PackageMetadata metadata);
    // Packages in `other` replace same-named packages here, all versions at once.
    void merge(const RepositoryIndex& other);

    bool empty() const { return packages_.empty(); }
    bool contains(const std::string& name) const;
    bool contains(const std::string& name, const std::string& version) const;

    // Explicit version, or the newest one when omitted. Throws UnknownPackage.
    const PackageMetadata& metadata_for(const std::string& name, const std::optional<std::string>& version = std::nullopt) const;
    std::string latest_version(const std::string& name) const;
    // Newest version satisfying (op, required); newest overall when required is empty.
    // Throws UnknownPackage or UnsatisfiableDependency.
    std::string latest_satisfying(const std::string& name, const std::string& op, const std::optional<std::string>& required) const;

    const std::map<std::string, VersionMap>& packages() const { return packages_; }

    // Latest version of every package whose name or description matches the
    // case-insensitive regex, by name. An empty pattern matches everything.
    std::vector<PackageMetadata> search(const std::string& pattern) const;

    // Repository document: {name: {version: {metadata: {...}, filename, hash}}}
    static RepositoryIndex from_json(const json& j, const std::optional<std::string>& source_url = std::nullopt);
    json to_json() const;

    static RepositoryIndex load_cache(const std::filesystem::path& path);
    void save_cache(const std::filesystem::path& path) const;

private:
    std::map<std::string, VersionMap> packages_;
};

// Downloads packages.json from every source and merges them in order.
RepositoryIndex fetch_repository_index(const std::vector<RepositorySource>& sources);

// Loads the local cache when present, otherwise (or when regenerate is set)
// fetches from the sources and rewrites the cache.
RepositoryIndex update_local_repo_info(bool regenerate = false);
