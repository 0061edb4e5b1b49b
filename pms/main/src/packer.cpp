#include "packer.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "metadata.hpp"
#include "script.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <climits>
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct ArchiveWriterDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* entry) const {
        if (entry) {
            archive_entry_free(entry);
        }
    }
};

using ArchiveWriterHandle = std::unique_ptr<struct archive, ArchiveWriterDeleter>;
using ArchiveEntryHandle = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

std::string archive_error(struct archive* a) {
    const char* err = archive_error_string(a);
    return err ? std::string(err) : get_string("error.unknown");
}

void add_to_archive(struct archive* a, const fs::path& path, const std::string& entry_name) {
    ArchiveEntryHandle entry(archive_entry_new());
    archive_entry_set_pathname(entry.get(), entry_name.c_str());

    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        throw PmsException(string_format("error.open_file_failed", path.string()));
    }
    archive_entry_copy_stat(entry.get(), &st);

    if (S_ISLNK(st.st_mode)) {
        char link_target[PATH_MAX];
        ssize_t len = readlink(path.c_str(), link_target, sizeof(link_target) - 1);
        if (len != -1) {
            link_target[len] = '\0';
            archive_entry_set_symlink(entry.get(), link_target);
        }
    }

    if (archive_write_header(a, entry.get()) != ARCHIVE_OK) {
        throw PmsException(string_format("error.archive_write_header_failed", entry_name, archive_error(a)));
    }

    if (S_ISREG(st.st_mode)) {
        std::ifstream f(path, std::ios::binary);
        char buffer[8192];
        while (f.read(buffer, sizeof(buffer)) || f.gcount() > 0) {
            if (archive_write_data(a, buffer, static_cast<size_t>(f.gcount())) < 0) {
                throw PmsException(string_format("error.archive_write_data_failed", entry_name, archive_error(a)));
            }
        }
    }
}

void create_tar_gz(const fs::path& output, const fs::path& source_dir) {
    ArchiveWriterHandle a(archive_write_new());
    archive_write_add_filter_gzip(a.get());
    archive_write_set_format_pax_restricted(a.get());

    if (archive_write_open_filename(a.get(), output.c_str()) != ARCHIVE_OK) {
        throw PmsException(string_format("error.archive_open_failed", output.string(), archive_error(a.get())));
    }

    // Sorted so that identical trees produce identical archives.
    std::vector<fs::path> entries;
    for (const auto& entry : fs::recursive_directory_iterator(source_dir)) {
        entries.push_back(entry.path());
    }
    std::ranges::sort(entries);

    for (const auto& path : entries) {
        add_to_archive(a.get(), path, path.lexically_relative(source_dir).string());
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        throw PmsException(string_format("error.archive_close_failed", output.string(), archive_error(a.get())));
    }
}

void check_package_scripts(const fs::path& pms_dir) {
    for (const char* script : {"install", "remove"}) {
        if (find_lifecycle_script(pms_dir / script).empty()) {
            throw InvalidMetadata(string_format("error.build_missing_script", std::string(script), pms_dir.string()));
        }
    }
}

} // anonymous namespace

std::pair<fs::path, std::string> build_package(const fs::path& package_dir) {
    fs::path base_dir = fs::absolute(package_dir).lexically_normal();
    if (base_dir.filename().empty()) base_dir = base_dir.parent_path();

    const fs::path pms_dir = base_dir / "pms";
    if (!fs::is_directory(pms_dir)) {
        throw InvalidMetadata(string_format("error.build_no_pms_dir", pms_dir.string()));
    }

    const fs::path metadata_file = pms_dir / PKG_METADATA_FILE;
    if (!fs::is_regular_file(metadata_file)) {
        throw InvalidMetadata(string_format("error.build_no_metadata", metadata_file.string()));
    }

    json metadata;
    try {
        metadata = json::parse(read_file(metadata_file));
    } catch (const json::exception& e) {
        throw InvalidMetadata(string_format("error.metadata_parse_failed", metadata_file.string(), e.what()));
    }
    check_metadata_content(metadata);

    if (fs::is_directory(base_dir / "data")) {
        check_package_scripts(pms_dir);
    }

    const std::string name = metadata["name"].get<std::string>();
    const std::string version = metadata["version"].get<std::string>();
    const fs::path output = base_dir.parent_path() / package_filename(name, version);

    log_info(string_format("info.build_packing", base_dir.string()));
    std::error_code ec;
    fs::remove(output, ec);
    create_tar_gz(output, base_dir);

    const std::string hash = calculate_sha256(output);
    std::cout << string_format("info.build_created", output.string()) << std::endl;
    std::cout << string_format("info.build_hash", hash) << std::endl;
    return {output, hash};
}
