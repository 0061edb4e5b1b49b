#include "registry.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <unistd.h>

#include <algorithm>

namespace fs = std::filesystem;

LocalRegistry::LocalRegistry(fs::path directory) : directory_(std::move(directory)) {}

fs::path LocalRegistry::entry_path(const std::string& name) const {
    return validate_path(name + ".json", directory_);
}

void LocalRegistry::publish(const PackageMetadata& metadata) {
    ensure_dir_exists(directory_);

    json entry = {
        {"Name", metadata.name},
        {"Version", metadata.version},
        {"Description", metadata.description},
        {"Maintainer", metadata.maintainer},
        {"Specification", metadata.specification},
        {"Dependencies", metadata.dependencies},
        {"InstallDate", current_timestamp()},
    };
    if (metadata.homepage) entry["Homepage"] = *metadata.homepage;

    write_file_atomic(entry_path(metadata.name), entry.dump(2));
}

void LocalRegistry::unpublish(const std::string& name) {
    std::error_code ec;
    fs::remove(entry_path(name), ec);
    if (ec) {
        throw PmsException(string_format("error.registry_unpublish_failed", name, ec.message()));
    }
}

bool LocalRegistry::is_privileged() const {
    return geteuid() == 0;
}

std::vector<PackageMetadata> LocalRegistry::published() const {
    std::vector<PackageMetadata> packages;
    if (!fs::is_directory(directory_)) return packages;

    for (const auto& file : fs::directory_iterator(directory_)) {
        if (!file.is_regular_file() || file.path().extension() != ".json") continue;
        try {
            const json entry = json::parse(read_file(file.path()));
            PackageMetadata m;
            m.name = entry.value("Name", "");
            m.version = entry.value("Version", "");
            m.description = entry.value("Description", "");
            m.maintainer = entry.value("Maintainer", "");
            m.specification = entry.value("Specification", "");
            if (entry.contains("Homepage") && entry["Homepage"].is_string()) {
                m.homepage = entry["Homepage"].get<std::string>();
            }
            if (entry.contains("Dependencies") && entry["Dependencies"].is_array()) {
                m.dependencies = entry["Dependencies"].get<std::vector<std::string>>();
            }
            packages.push_back(std::move(m));
        } catch (const json::exception& e) {
            log_warning(string_format("warning.registry_entry_unreadable", file.path().string(), e.what()));
        }
    }

    std::ranges::sort(packages, {}, &PackageMetadata::name);
    return packages;
}
