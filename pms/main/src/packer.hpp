#pragma once

#include <filesystem>
#include <string>
#include <utility>

// Validates a package source tree (pms/metadata.json, optional data/ with its
// install and remove scripts) and writes <name>_<version>_<arch>.tar.gz next
// to it. Returns the archive path and its SHA256.
std::pair<std::filesystem::path, std::string> build_package(const std::filesystem::path& package_dir);
