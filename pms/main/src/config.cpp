#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/utsname.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

fs::path ROOT_DIR = "/";
fs::path CONFIG_DIR = PMS_CONF_DIR;
fs::path DATA_DIR = PMS_DATA_DIR;
fs::path L10N_DIR = PMS_L10N_DIR;
fs::path LOCK_DIR = PMS_LOCK_DIR;

// Derived paths
fs::path INFO_DIR = fs::path(PMS_DATA_DIR) / "info";
fs::path TEMP_DIR = fs::path(PMS_DATA_DIR) / "temp";
fs::path REGISTRY_DIR = fs::path(PMS_DATA_DIR) / "registry";
fs::path SOURCES_FILE = fs::path(PMS_CONF_DIR) / "sources.list";
fs::path REPO_CACHE_FILE = fs::path(PMS_DATA_DIR) / REPO_FILE;
fs::path STATUS_FILE = fs::path(PMS_DATA_DIR) / "status.json";
fs::path LOCK_FILE = fs::path(PMS_LOCK_DIR) / "db.lck";

void set_root_path(const std::string& root_path) {
    ROOT_DIR = fs::path(root_path).lexically_normal();
    if (ROOT_DIR.empty()) ROOT_DIR = "/";

    auto rebase = [&](const std::string& default_path) {
        fs::path p(default_path);
        if (p.is_absolute()) {
            return ROOT_DIR / p.relative_path();
        }
        return ROOT_DIR / p;
    };

    CONFIG_DIR = rebase(PMS_CONF_DIR);
    DATA_DIR = rebase(PMS_DATA_DIR);
    L10N_DIR = rebase(PMS_L10N_DIR);
    LOCK_DIR = rebase(PMS_LOCK_DIR);

    INFO_DIR = DATA_DIR / "info";
    TEMP_DIR = DATA_DIR / "temp";
    REGISTRY_DIR = DATA_DIR / "registry";
    SOURCES_FILE = CONFIG_DIR / "sources.list";
    REPO_CACHE_FILE = DATA_DIR / REPO_FILE;
    STATUS_FILE = DATA_DIR / "status.json";
    LOCK_FILE = LOCK_DIR / "db.lck";
}

void init_filesystem() {
    ensure_dir_exists(CONFIG_DIR);
    ensure_dir_exists(DATA_DIR);
    ensure_dir_exists(INFO_DIR);
    ensure_dir_exists(TEMP_DIR);
    ensure_dir_exists(REGISTRY_DIR);
    ensure_dir_exists(LOCK_DIR);
}

static std::string g_architecture_override;

void set_architecture(const std::string& arch) {
    g_architecture_override = arch;
}

std::string get_architecture() {
    if (!g_architecture_override.empty()) {
        return g_architecture_override;
    }

    struct utsname buf;
    if (uname(&buf) != 0) {
        throw PmsException(get_string("error.get_arch_failed"));
    }
    std::string arch(buf.machine);
    if (arch != "x86_64" && arch != "aarch64") {
        throw PmsException(string_format("error.unsupported_arch", arch));
    }
    return (arch == "x86_64") ? "amd64" : "arm64";
}

std::vector<RepositorySource> get_repository_sources() {
    std::ifstream sources_file(SOURCES_FILE);
    if (!sources_file.is_open()) {
        throw PmsException(string_format("error.sources_missing", SOURCES_FILE.string()));
    }

    std::vector<RepositorySource> sources;
    std::string line;
    while (std::getline(sources_file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        RepositorySource source;
        if (!(iss >> source.url)) continue;
        std::getline(iss >> std::ws, source.label);
        while (!source.url.empty() && source.url.back() == '/') source.url.pop_back();
        sources.push_back(std::move(source));
    }
    return sources;
}

std::string package_filename(const std::string& name, const std::string& version) {
    return name + "_" + version + "_" + get_architecture() + PKG_EXT;
}
