#include "repository.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <ranges>
#include <regex>

namespace fs = std::filesystem;

void RepositoryIndex::add(PackageMetadata metadata) {
    auto& versions = packages_[metadata.name];
    std::string version = metadata.version;
    versions.insert_or_assign(std::move(version), std::move(metadata));
}

void RepositoryIndex::merge(const RepositoryIndex& other) {
    for (const auto& [name, versions] : other.packages_) {
        packages_[name] = versions;
    }
}

bool RepositoryIndex::contains(const std::string& name) const {
    auto it = packages_.find(name);
    return it != packages_.end() && !it->second.empty();
}

bool RepositoryIndex::contains(const std::string& name, const std::string& version) const {
    if (!is_valid_version(version)) return false;
    auto it = packages_.find(name);
    return it != packages_.end() && it->second.contains(version);
}

const PackageMetadata& RepositoryIndex::metadata_for(const std::string& name, const std::optional<std::string>& version) const {
    auto it = packages_.find(name);
    if (it == packages_.end() || it->second.empty()) {
        throw UnknownPackage(string_format("error.package_not_in_repo", name));
    }
    if (!version) {
        return it->second.rbegin()->second;
    }
    if (!is_valid_version(*version)) {
        throw UnknownPackage(string_format("error.version_not_in_repo", name, *version));
    }
    auto vit = it->second.find(*version);
    if (vit == it->second.end()) {
        throw UnknownPackage(string_format("error.version_not_in_repo", name, *version));
    }
    return vit->second;
}

std::string RepositoryIndex::latest_version(const std::string& name) const {
    return metadata_for(name).version;
}

std::string RepositoryIndex::latest_satisfying(const std::string& name, const std::string& op, const std::optional<std::string>& required) const {
    auto it = packages_.find(name);
    if (it == packages_.end() || it->second.empty()) {
        throw UnknownPackage(string_format("error.package_not_in_repo", name));
    }
    if (!required) {
        return it->second.rbegin()->first;
    }
    for (const auto& version : it->second | std::views::keys | std::views::reverse) {
        if (version_satisfies(version, op, *required)) {
            return version;
        }
    }
    throw UnsatisfiableDependency(string_format("error.dependency_not_available", name, op, *required));
}

std::vector<PackageMetadata> RepositoryIndex::search(const std::string& pattern) const {
    std::regex expression;
    try {
        expression = std::regex(pattern, std::regex::icase);
    } catch (const std::regex_error& e) {
        throw PmsException(string_format("error.invalid_search_pattern", pattern, e.what()));
    }

    std::vector<PackageMetadata> matches;
    for (const auto& [name, versions] : packages_) {
        if (versions.empty()) continue;
        const PackageMetadata& latest = versions.rbegin()->second;
        if (pattern.empty() || std::regex_search(name, expression) || std::regex_search(latest.description, expression)) {
            matches.push_back(latest);
        }
    }
    return matches;
}

RepositoryIndex RepositoryIndex::from_json(const json& j, const std::optional<std::string>& source_url) {
    if (!j.is_object()) {
        throw PmsException(get_string("error.repo_index_malformed"));
    }

    RepositoryIndex index;
    for (const auto& [name, versions] : j.items()) {
        if (!versions.is_object()) {
            throw PmsException(string_format("error.repo_entry_malformed", name));
        }
        for (const auto& [version, entry] : versions.items()) {
            if (!entry.is_object()) {
                throw PmsException(string_format("error.repo_entry_malformed", name));
            }
            if (!is_valid_version(version)) {
                log_warning(string_format("warning.skip_invalid_version", name, version));
                continue;
            }
            PackageMetadata m = metadata_from_json(entry.value("metadata", json::object()));
            m.name = name;
            m.version = version;
            if (entry.contains("filename") && entry["filename"].is_string()) m.filename = entry["filename"].get<std::string>();
            if (entry.contains("hash") && entry["hash"].is_string()) m.hash = entry["hash"].get<std::string>();
            if (source_url) m.url = *source_url;
            index.add(std::move(m));
        }
    }
    return index;
}

json RepositoryIndex::to_json() const {
    json j = json::object();
    for (const auto& [name, versions] : packages_) {
        json& package = j[name];
        package = json::object();
        for (const auto& [version, m] : versions) {
            json entry = {{"metadata", metadata_to_json(m)}};
            if (m.filename) entry["filename"] = *m.filename;
            if (m.hash) entry["hash"] = *m.hash;
            package[version] = std::move(entry);
        }
    }
    return j;
}

RepositoryIndex RepositoryIndex::load_cache(const fs::path& path) {
    try {
        return from_json(json::parse(read_file(path)));
    } catch (const json::exception& e) {
        throw PmsException(string_format("error.repo_cache_corrupt", path.string(), e.what()));
    }
}

void RepositoryIndex::save_cache(const fs::path& path) const {
    write_file_atomic(path, to_json().dump(2));
}

RepositoryIndex fetch_repository_index(const std::vector<RepositorySource>& sources) {
    RepositoryIndex merged;
    ensure_dir_exists(TEMP_DIR);

    for (const auto& source : sources) {
        log_info(string_format("info.downloading_index", source.url));

        fs::path index_path;
        const bool is_local = source.url.starts_with("file://") || source.url.starts_with("/");
        if (is_local) {
            const std::string dir = source.url.starts_with("file://") ? source.url.substr(7) : source.url;
            index_path = fs::path(dir) / REPO_FILE;
        } else {
            index_path = TEMP_DIR / REPO_FILE;
            download_with_retries(source.url + "/" + REPO_FILE, index_path, 3, false);
        }

        try {
            merged.merge(RepositoryIndex::from_json(json::parse(read_file(index_path)), source.url));
        } catch (const json::exception& e) {
            throw PmsException(string_format("error.repo_index_parse_failed", source.url, e.what()));
        }
        if (!is_local) fs::remove(index_path);
    }
    return merged;
}

RepositoryIndex update_local_repo_info(bool regenerate) {
    if (!regenerate && fs::exists(REPO_CACHE_FILE)) {
        return RepositoryIndex::load_cache(REPO_CACHE_FILE);
    }

    const auto sources = get_repository_sources();
    if (!get_quiet_mode()) {
        log_info(get_string("info.package_sources"));
        for (const auto& source : sources) {
            log_info(string_format("info.source_entry", source.url, source.label));
        }
    }

    RepositoryIndex index = fetch_repository_index(sources);
    log_info(string_format("info.writing_package_list", REPO_CACHE_FILE.string()));
    index.save_cache(REPO_CACHE_FILE);
    return index;
}
