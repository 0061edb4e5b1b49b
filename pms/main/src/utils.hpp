#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);

// Quiet mode silences log_info and progress output
void set_quiet_mode(bool enable);
bool get_quiet_mode();

// Interactive mode control
enum class NonInteractiveMode {
    INTERACTIVE,
    YES,
    NO
};

void set_non_interactive_mode(NonInteractiveMode mode);
NonInteractiveMode get_non_interactive_mode();

// default_yes selects the answer an empty or unrecognized reply maps to.
bool user_confirms(const std::string& prompt, bool default_yes = false);

// Concurrency control (RAII lock)
class DBLock {
public:
    DBLock();
    ~DBLock();
    DBLock(const DBLock&) = delete;
    DBLock& operator=(const DBLock&) = delete;
private:
    int lock_fd = -1;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
void write_file_atomic(const fs::path& path, const std::string& content);
std::string read_file(const fs::path& path);
fs::path validate_path(const fs::path& path, const fs::path& root);

// Local time as ISO 8601, used for install and removal stamps
std::string current_timestamp();
