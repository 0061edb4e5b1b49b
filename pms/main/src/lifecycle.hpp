#pragma once

#include "metadata.hpp"

#include <filesystem>
#include <optional>
#include <string>

// Everything that touches package archives and their scripts on disk.
// Any failure throws and halts the current transaction step.
class ArchiveLifecycle {
public:
    virtual ~ArchiveLifecycle() = default;

    // Downloads (or copies) the archive into the temporary area and verifies its hash.
    virtual std::filesystem::path fetch(const PackageMetadata& metadata) = 0;
    // Extracts the archive and returns the staging directory.
    virtual std::filesystem::path unpack(const PackageMetadata& metadata, const std::filesystem::path& archive) = 0;
    // Records the package info files, then runs preinst, install and postinst.
    virtual void configure(const PackageMetadata& metadata, const std::filesystem::path& staging) = 0;
    // Runs prerm, remove and postrm, then deletes the package info files.
    virtual void deconfigure(const PackageMetadata& metadata) = 0;
    // Metadata recorded by configure(), if the package has any.
    virtual std::optional<PackageMetadata> installed_metadata(const std::string& name) const = 0;
    // Reads the metadata embedded in an archive on local disk.
    virtual PackageMetadata inspect_archive(const std::filesystem::path& archive) = 0;
    virtual void cleanup(const PackageMetadata& metadata) = 0;
};

class LocalArchiveLifecycle : public ArchiveLifecycle {
public:
    LocalArchiveLifecycle(std::filesystem::path temp_dir, std::filesystem::path info_dir);

    std::filesystem::path fetch(const PackageMetadata& metadata) override;
    std::filesystem::path unpack(const PackageMetadata& metadata, const std::filesystem::path& archive) override;
    void configure(const PackageMetadata& metadata, const std::filesystem::path& staging) override;
    void deconfigure(const PackageMetadata& metadata) override;
    std::optional<PackageMetadata> installed_metadata(const std::string& name) const override;
    PackageMetadata inspect_archive(const std::filesystem::path& archive) override;
    void cleanup(const PackageMetadata& metadata) override;

private:
    std::filesystem::path archive_path(const PackageMetadata& metadata) const;
    std::filesystem::path staging_path(const PackageMetadata& metadata) const;
    void record_package_info(const PackageMetadata& metadata, const std::filesystem::path& staging) const;
    void delete_package_info(const std::string& name) const;

    std::filesystem::path temp_dir_;
    std::filesystem::path info_dir_;
};
