#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

struct PackageMetadata {
    std::string name;
    std::string version;
    std::string maintainer;
    std::string description;
    std::string specification;
    std::optional<std::string> homepage;
    std::vector<std::string> dependencies; // declarations, "name" or "name (op version)"

    // Download coordinates, filled in from the repository entry
    std::optional<std::string> url;
    std::optional<std::string> filename;
    std::optional<std::string> hash;

    // Set when installing from an archive on local disk instead of a mirror
    std::optional<std::string> local_archive;
};

// Lenient decoding: absent keys stay empty. The package-build validator is
// the place where required keys are enforced.
PackageMetadata metadata_from_json(const json& j);
json metadata_to_json(const PackageMetadata& metadata);

PackageMetadata load_metadata_file(const std::string& path);

// Throws InvalidMetadata when the document is not a valid package declaration.
void check_metadata_content(const json& j);
