#pragma once

#include <string>
#include <filesystem>

void extract_tar_gz(const std::filesystem::path& archive_path, const std::filesystem::path& output_dir);
// Returns an empty string when the entry is not in the archive.
std::string extract_file_from_archive(const std::filesystem::path& archive_path, const std::string& internal_path);
