#pragma once

#include <string>
#include <filesystem>

// Calculates the SHA256 hash of a file.
// Throws PmsException if the file cannot be opened.
std::string calculate_sha256(const std::filesystem::path& file_path);

// Throws PmsException when the file's SHA256 differs from expected_hash.
void verify_hash(const std::filesystem::path& file_path, const std::string& expected_hash);
