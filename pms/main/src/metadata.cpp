#include "metadata.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <regex>

namespace {

std::optional<std::string> optional_string(const json& j, const char* key) {
    if (auto it = j.find(key); it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

std::string string_or_empty(const json& j, const char* key) {
    return optional_string(j, key).value_or("");
}

} // anonymous namespace

PackageMetadata metadata_from_json(const json& j) {
    if (!j.is_object()) {
        throw InvalidMetadata(get_string("error.metadata_not_object"));
    }

    PackageMetadata m;
    m.name = string_or_empty(j, "name");
    m.version = string_or_empty(j, "version");
    m.maintainer = string_or_empty(j, "maintainer");
    m.description = string_or_empty(j, "description");
    m.specification = string_or_empty(j, "specification");
    m.homepage = optional_string(j, "homepage");
    m.url = optional_string(j, "url");

    if (auto it = j.find("dependencies"); it != j.end() && it->is_array()) {
        for (const auto& dep : *it) {
            if (dep.is_string()) m.dependencies.push_back(dep.get<std::string>());
        }
    }
    return m;
}

json metadata_to_json(const PackageMetadata& metadata) {
    json j = {
        {"name", metadata.name},
        {"version", metadata.version},
        {"maintainer", metadata.maintainer},
        {"description", metadata.description},
        {"specification", metadata.specification},
    };
    if (metadata.homepage) j["homepage"] = *metadata.homepage;
    if (!metadata.dependencies.empty()) j["dependencies"] = metadata.dependencies;
    if (metadata.url) j["url"] = *metadata.url;
    return j;
}

PackageMetadata load_metadata_file(const std::string& path) {
    try {
        return metadata_from_json(json::parse(read_file(path)));
    } catch (const json::exception& e) {
        throw InvalidMetadata(string_format("error.metadata_parse_failed", path, e.what()));
    }
}

void check_metadata_content(const json& j) {
    if (!j.is_object()) {
        throw InvalidMetadata(get_string("error.metadata_not_object"));
    }

    for (const char* key : {"name", "version", "maintainer", "description", "specification"}) {
        if (!j.contains(key)) {
            throw InvalidMetadata(string_format("error.metadata_missing_key", std::string(PKG_METADATA_FILE), std::string(key)));
        }
        if (!j[key].is_string()) {
            throw InvalidMetadata(string_format("error.metadata_key_not_string", std::string(key)));
        }
    }

    if (j["specification"].get<std::string>() != METADATA_SPECIFICATION) {
        throw InvalidMetadata(string_format("error.metadata_bad_specification", std::string(METADATA_SPECIFICATION)));
    }

    if (!is_valid_version(j["version"].get<std::string>())) {
        throw InvalidMetadata(string_format("error.invalid_version_format", j["version"].get<std::string>()));
    }

    if (!j.contains("dependencies")) return;

    if (!j["dependencies"].is_array()) {
        throw InvalidMetadata(get_string("error.metadata_dependencies_not_list"));
    }

    static const std::regex dependency_regex(R"(^[a-zA-Z0-9_-]+( \((=|[<>]=?) [0-9]+(\.[0-9]+)*\))?$)");
    for (const auto& dependency : j["dependencies"]) {
        if (!dependency.is_string() || !std::regex_match(dependency.get<std::string>(), dependency_regex)) {
            throw InvalidMetadata(string_format("error.metadata_bad_dependency", dependency.dump()));
        }
    }
}
