#pragma once

#include "lifecycle.hpp"
#include "registry.hpp"
#include "repository.hpp"
#include "resolver.hpp"
#include "status.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

enum class Operation {
    install,
    remove
};

struct PackageManagerOptions {
    bool assume_yes = false; // skip the dependency confirmation prompts
};

// Turns resolution plans into ordered install and remove actions. Every
// state change of a package is recorded in the ledger before the next
// collaborator call, so an interrupted run leaves a visible trail.
class PackageManager {
public:
    PackageManager(RepositoryIndex& index, StatusLedger& ledger, ArchiveLifecycle& lifecycle,
                   PlatformRegistry& registry, PackageManagerOptions options = {});

    // Dependencies of the package against the installed set, root excluded.
    // Side-effect free.
    ResolutionPlan plan_install(const std::string& name, const std::optional<std::string>& version = std::nullopt) const;

    // Filters the plan to what still has to change, asks the operator unless
    // auto_confirm, then applies each package in plan order. Throws
    // OperationCancelled when the operator declines.
    void confirm_and_apply(const ResolutionPlan& plan, Operation operation, bool auto_confirm);

    // `name` may also be the path of a package archive on local disk.
    void install_package(const std::string& name, const std::optional<std::string>& version = std::nullopt);
    // Throws NotInstalled when no version of the package is installed.
    void remove_package(const std::string& name, bool force = false);
    // Moves every package with a newer version in the index to that version.
    // Returns the resulting name -> version map.
    std::map<std::string, std::string> upgrade(const std::optional<std::map<std::string, std::string>>& installed = std::nullopt);

    std::vector<PackageMetadata> list(bool summary) const;
    std::vector<PackageMetadata> search(const std::string& query, bool summary) const;
    // Prints the recorded state of the package; false when it was never seen.
    bool status(const std::string& name) const;
    bool is_installed(const std::string& name) const;
    void clean();

private:
    PackageMetadata metadata_for_removal(const std::string& name, const std::string& version) const;
    void run_install_lifecycle(const PackageMetadata& metadata);
    void run_remove_lifecycle(const PackageMetadata& metadata);
    ResolutionPlan plan_removal(const std::string& name, const std::string& version) const;

    RepositoryIndex& index_;
    StatusLedger& ledger_;
    ArchiveLifecycle& lifecycle_;
    PlatformRegistry& registry_;
    PackageManagerOptions options_;
};
