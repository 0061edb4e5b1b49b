#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

constexpr int EXTRACT_FLAGS = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                              ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_UNLINK;

std::string archive_error(struct archive* a, const std::string& fallback_key) {
    const char* err = archive_error_string(a);
    return err ? std::string(err) : get_string(fallback_key);
}

[[noreturn]] void fail(const fs::path& archive_path, struct archive* a, const std::string& fallback_key) {
    throw PmsException(string_format("error.extract_failed", archive_path.string()) + ": " + archive_error(a, fallback_key));
}

// Package archives are built relative to the package root, sometimes as "./x".
std::string normalize_entry_path(const char* raw) {
    std::string path = raw ? raw : "";
    while (path.starts_with("./")) path.erase(0, 2);
    return path;
}

ArchiveReadHandle open_for_reading(const fs::path& archive_path) {
    ArchiveReadHandle a(archive_read_new());
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());
    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        throw PmsException(string_format("error.open_file_failed", archive_path.string()) + ": " + archive_error(a.get(), "error.unknown"));
    }
    return a;
}

// Rewrites the entry (and its hardlink target) to an absolute path under
// output_dir, rejecting anything that would escape it.
void relocate_entry(struct archive_entry* entry, const std::string& entry_path, const fs::path& output_dir) {
    fs::path dest_path;
    try {
        dest_path = validate_path(entry_path, output_dir);
    } catch (const PmsException&) {
        throw PmsException(string_format("error.malicious_path_in_archive", entry_path));
    }
    archive_entry_set_pathname(entry, dest_path.c_str());

    if (const char* hardlink = archive_entry_hardlink(entry)) {
        const std::string link_path = normalize_entry_path(hardlink);
        fs::path link_dest;
        try {
            link_dest = validate_path(link_path, output_dir);
        } catch (const PmsException&) {
            throw PmsException(string_format("error.malicious_path_in_archive", link_path));
        }
        archive_entry_set_hardlink(entry, link_dest.c_str());
    }
}

void copy_entry_data(const fs::path& archive_path, struct archive* reader, struct archive* writer) {
    const void* buff;
    size_t size;
    la_int64_t offset;
    for (;;) {
        const int r = archive_read_data_block(reader, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) return;
        if (r < ARCHIVE_WARN) fail(archive_path, reader, "error.data_block_read");
        if (r < ARCHIVE_OK) {
            log_warning(archive_error(reader, "error.unknown"));
            return;
        }
        if (archive_write_data_block(writer, buff, size, offset) < ARCHIVE_OK) {
            fail(archive_path, writer, "error.data_block_write");
        }
    }
}

} // anonymous namespace

void extract_tar_gz(const fs::path& archive_path, const fs::path& output_dir) {
    ensure_dir_exists(output_dir);

    ArchiveReadHandle reader = open_for_reading(archive_path);
    ArchiveWriteHandle writer(archive_write_disk_new());
    archive_write_disk_set_options(writer.get(), EXTRACT_FLAGS);
    archive_write_disk_set_standard_lookup(writer.get());

    long long count = 0;
    struct archive_entry* entry;
    for (int r; (r = archive_read_next_header(reader.get(), &entry)) != ARCHIVE_EOF;) {
        if (r < ARCHIVE_WARN) fail(archive_path, reader.get(), "error.fatal_read");
        if (r < ARCHIVE_OK) log_warning(archive_error(reader.get(), "error.unknown"));

        const std::string entry_path = normalize_entry_path(archive_entry_pathname(entry));
        if (entry_path.empty() || entry_path == ".") continue;
        relocate_entry(entry, entry_path, output_dir);

        r = archive_write_header(writer.get(), entry);
        if (r < ARCHIVE_WARN) fail(archive_path, writer.get(), "error.fatal_write");
        if (r < ARCHIVE_OK) {
            log_warning(archive_error(writer.get(), "error.unknown"));
        } else {
            copy_entry_data(archive_path, reader.get(), writer.get());
            if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
                fail(archive_path, writer.get(), "error.fatal_write");
            }
        }
        ++count;
    }

    log_info(string_format("info.extract_complete", count));
}

std::string extract_file_from_archive(const fs::path& archive_path, const std::string& internal_path) {
    ArchiveReadHandle reader = open_for_reading(archive_path);

    struct archive_entry* entry;
    for (int r; (r = archive_read_next_header(reader.get(), &entry)) != ARCHIVE_EOF;) {
        if (r < ARCHIVE_WARN) fail(archive_path, reader.get(), "error.fatal_read");
        if (r < ARCHIVE_OK) log_warning(archive_error(reader.get(), "error.unknown"));

        if (normalize_entry_path(archive_entry_pathname(entry)) != internal_path) {
            archive_read_data_skip(reader.get());
            continue;
        }

        std::string content;
        char buffer[8192];
        la_ssize_t n;
        while ((n = archive_read_data(reader.get(), buffer, sizeof(buffer))) > 0) {
            content.append(buffer, static_cast<size_t>(n));
        }
        if (n < 0) fail(archive_path, reader.get(), "error.data_block_read");
        return content;
    }
    return "";
}
