#pragma once

#include <filesystem>

// Runs <base_path>.sh with /bin/sh or <base_path>.py with python3, in the
// script's directory. A package without the script counts as success.
bool run_lifecycle_script(const std::filesystem::path& base_path);

// Finds <base_path>.sh or <base_path>.py; empty when neither exists.
std::filesystem::path find_lifecycle_script(const std::filesystem::path& base_path);
