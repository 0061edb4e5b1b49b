#pragma once

#include "metadata.hpp"

#include <filesystem>
#include <string>
#include <vector>

// Where installed packages become visible to the rest of the system.
class PlatformRegistry {
public:
    virtual ~PlatformRegistry() = default;

    virtual void publish(const PackageMetadata& metadata) = 0;
    virtual void unpublish(const std::string& name) = 0;
    virtual bool is_privileged() const = 0;
    virtual std::vector<PackageMetadata> published() const = 0;
};

// One JSON document per package under a registry directory.
class LocalRegistry : public PlatformRegistry {
public:
    explicit LocalRegistry(std::filesystem::path directory);

    void publish(const PackageMetadata& metadata) override;
    void unpublish(const std::string& name) override;
    bool is_privileged() const override;
    std::vector<PackageMetadata> published() const override;

private:
    std::filesystem::path entry_path(const std::string& name) const;

    std::filesystem::path directory_;
};
