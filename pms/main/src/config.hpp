#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Build-time defaults, overridden from CMake.
#ifndef PMS_CONF_DIR
#define PMS_CONF_DIR "/etc/pms"
#endif
#ifndef PMS_DATA_DIR
#define PMS_DATA_DIR "/var/lib/pms"
#endif
#ifndef PMS_L10N_DIR
#define PMS_L10N_DIR "/usr/share/pms/l10n"
#endif
#ifndef PMS_LOCK_DIR
#define PMS_LOCK_DIR "/var/lock/pms"
#endif

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path ROOT_DIR;
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path DATA_DIR;
extern std::filesystem::path L10N_DIR;
extern std::filesystem::path LOCK_DIR;

// Derived paths
extern std::filesystem::path INFO_DIR;
extern std::filesystem::path TEMP_DIR;
extern std::filesystem::path REGISTRY_DIR;
extern std::filesystem::path SOURCES_FILE;
extern std::filesystem::path REPO_CACHE_FILE;
extern std::filesystem::path STATUS_FILE;
extern std::filesystem::path LOCK_FILE;

inline constexpr const char* PROGRAM_NAME = "pms";
inline constexpr const char* PROGRAM_VERSION = "1.0.0";
inline constexpr const char* METADATA_SPECIFICATION = "1.0.0";
inline constexpr const char* PKG_METADATA_FILE = "metadata.json";
inline constexpr const char* REPO_FILE = "packages.json";
inline constexpr const char* PKG_EXT = ".tar.gz";

struct RepositorySource {
    std::string url;
    std::string label;
};

// Functions
void set_root_path(const std::string& root_path);
void init_filesystem();
void set_architecture(const std::string& arch); // Manually override architecture
std::string get_architecture();
std::vector<RepositorySource> get_repository_sources();
std::string package_filename(const std::string& name, const std::string& version);
