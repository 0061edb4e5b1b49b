#include "lifecycle.hpp"

#include "archive.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "script.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::array<const char*, 6> LIFECYCLE_SCRIPTS = {"preinst", "install", "postinst", "prerm", "remove", "postrm"};
constexpr std::array<const char*, 2> SCRIPT_EXTENSIONS = {".sh", ".py"};

bool is_local_url(const std::string& url) {
    return url.starts_with("file://") || url.starts_with("/");
}

std::string strip_file_scheme(const std::string& url) {
    return url.starts_with("file://") ? url.substr(7) : url;
}

void copy_into(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    if (fs::exists(target) && fs::equivalent(source, target, ec)) return;
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw PmsException(string_format("error.copy_failed", source.string(), target.string(), ec.message()));
    }
}

} // anonymous namespace

LocalArchiveLifecycle::LocalArchiveLifecycle(fs::path temp_dir, fs::path info_dir)
    : temp_dir_(std::move(temp_dir)), info_dir_(std::move(info_dir)) {}

fs::path LocalArchiveLifecycle::archive_path(const PackageMetadata& metadata) const {
    if (metadata.local_archive) {
        return temp_dir_ / fs::path(*metadata.local_archive).filename();
    }
    if (metadata.filename) {
        return validate_path(*metadata.filename, temp_dir_);
    }
    return temp_dir_ / package_filename(metadata.name, metadata.version);
}

fs::path LocalArchiveLifecycle::staging_path(const PackageMetadata& metadata) const {
    return validate_path(metadata.name, temp_dir_);
}

fs::path LocalArchiveLifecycle::fetch(const PackageMetadata& metadata) {
    ensure_dir_exists(temp_dir_);
    const fs::path target = archive_path(metadata);

    if (metadata.local_archive) {
        copy_into(*metadata.local_archive, target);
        return target;
    }

    if (!metadata.url || !metadata.filename) {
        throw PmsException(string_format("error.package_location_unknown", metadata.name, metadata.version));
    }

    const std::string source = *metadata.url + "/" + *metadata.filename;
    log_info(string_format("info.downloading_package", source));
    if (is_local_url(source)) {
        copy_into(strip_file_scheme(source), target);
    } else {
        download_with_retries(source, target);
    }
    log_info(string_format("info.package_downloaded", target.string()));

    if (metadata.hash) {
        verify_hash(target, *metadata.hash);
        log_info(get_string("info.package_verified"));
    } else {
        log_warning(string_format("warning.package_not_verified", metadata.name));
    }
    return target;
}

fs::path LocalArchiveLifecycle::unpack(const PackageMetadata& metadata, const fs::path& archive) {
    const fs::path staging = staging_path(metadata);
    std::error_code ec;
    fs::remove_all(staging, ec);

    log_info(string_format("info.extracting_package", metadata.name));
    extract_tar_gz(archive, staging);

    if (!fs::is_regular_file(staging / "pms" / PKG_METADATA_FILE)) {
        throw InvalidMetadata(string_format("error.archive_missing_metadata", archive.string()));
    }
    return staging;
}

void LocalArchiveLifecycle::record_package_info(const PackageMetadata& metadata, const fs::path& staging) const {
    ensure_dir_exists(info_dir_);
    const fs::path pms_dir = staging / "pms";

    copy_into(pms_dir / PKG_METADATA_FILE, info_dir_ / (metadata.name + "." + PKG_METADATA_FILE));

    for (const char* script : LIFECYCLE_SCRIPTS) {
        for (const char* ext : SCRIPT_EXTENSIONS) {
            const fs::path script_path = pms_dir / (std::string(script) + ext);
            if (fs::is_regular_file(script_path)) {
                copy_into(script_path, info_dir_ / (metadata.name + "." + script + ext));
            }
        }
    }

    const fs::path data_dir = staging / "data";
    if (!fs::is_directory(data_dir)) return;

    std::vector<std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(data_dir)) {
        if (entry.is_regular_file()) {
            files.push_back(fs::relative(entry.path(), data_dir).string());
        }
    }
    if (files.empty()) return;

    std::ranges::sort(files);
    std::string listing;
    for (const auto& file : files) {
        listing += file + "\n";
    }
    write_file_atomic(info_dir_ / (metadata.name + ".list"), listing);
}

void LocalArchiveLifecycle::configure(const PackageMetadata& metadata, const fs::path& staging) {
    log_info(string_format("info.configuring_package", metadata.name));
    record_package_info(metadata, staging);

    for (const char* script : {"preinst", "install", "postinst"}) {
        if (!run_lifecycle_script(staging / "pms" / script)) {
            throw PmsException(string_format("error.script_step_failed", std::string(script), metadata.name));
        }
    }
}

void LocalArchiveLifecycle::deconfigure(const PackageMetadata& metadata) {
    for (const char* script : {"prerm", "remove", "postrm"}) {
        if (!run_lifecycle_script(info_dir_ / (metadata.name + "." + script))) {
            throw PmsException(string_format("error.script_step_failed", std::string(script), metadata.name));
        }
    }
    delete_package_info(metadata.name);
}

void LocalArchiveLifecycle::delete_package_info(const std::string& name) const {
    if (!fs::is_directory(info_dir_)) return;

    const std::string prefix = name + ".";
    std::vector<fs::path> doomed;
    for (const auto& entry : fs::directory_iterator(info_dir_)) {
        if (entry.path().filename().string().starts_with(prefix)) {
            doomed.push_back(entry.path());
        }
    }
    for (const auto& path : doomed) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            log_warning(string_format("warning.delete_failed", path.string(), ec.message()));
        }
    }
}

std::optional<PackageMetadata> LocalArchiveLifecycle::installed_metadata(const std::string& name) const {
    const fs::path path = info_dir_ / (name + "." + PKG_METADATA_FILE);
    if (!fs::is_regular_file(path)) {
        return std::nullopt;
    }
    return load_metadata_file(path.string());
}

PackageMetadata LocalArchiveLifecycle::inspect_archive(const fs::path& archive) {
    const std::string content = extract_file_from_archive(archive, std::string("pms/") + PKG_METADATA_FILE);
    if (content.empty()) {
        throw InvalidMetadata(string_format("error.archive_missing_metadata", archive.string()));
    }

    json document;
    try {
        document = json::parse(content);
    } catch (const json::exception& e) {
        throw InvalidMetadata(string_format("error.metadata_parse_failed", archive.string(), e.what()));
    }
    check_metadata_content(document);

    PackageMetadata metadata = metadata_from_json(document);
    metadata.local_archive = fs::absolute(archive).string();
    return metadata;
}

void LocalArchiveLifecycle::cleanup(const PackageMetadata& metadata) {
    std::error_code ec;
    fs::remove_all(staging_path(metadata), ec);

    const fs::path archive = archive_path(metadata);
    if (metadata.local_archive && fs::path(*metadata.local_archive) == archive) return;
    fs::remove(archive, ec);
}
