#include "package_manager.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace {

std::string join(const std::vector<std::string>& items, std::string_view separator) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += separator;
        joined += item;
    }
    return joined;
}

void print_package(const PackageMetadata& m, bool summary) {
    if (summary) {
        std::cout << m.name << " " << m.version << std::endl;
        return;
    }
    std::cout << string_format("info.field_name", m.name) << "\n";
    std::cout << string_format("info.field_version", m.version) << "\n";
    std::cout << string_format("info.field_maintainer", m.maintainer) << "\n";
    std::cout << string_format("info.field_description", m.description) << "\n";
    if (m.homepage) {
        std::cout << string_format("info.field_homepage", *m.homepage) << "\n";
    }
    if (!m.dependencies.empty()) {
        std::cout << string_format("info.field_dependencies", join(m.dependencies, ", ")) << "\n";
    }
}

void print_packages(const std::vector<PackageMetadata>& packages, bool summary) {
    if (packages.empty()) {
        log_info(get_string("info.no_packages_found"));
        return;
    }
    for (const auto& m : packages) {
        print_package(m, summary);
        if (!summary) std::cout << std::endl;
    }
}

} // anonymous namespace

PackageManager::PackageManager(RepositoryIndex& index, StatusLedger& ledger, ArchiveLifecycle& lifecycle,
                               PlatformRegistry& registry, PackageManagerOptions options)
    : index_(index), ledger_(ledger), lifecycle_(lifecycle), registry_(registry), options_(options) {}

ResolutionPlan PackageManager::plan_install(const std::string& name, const std::optional<std::string>& version) const {
    const std::string pinned = version ? *version : index_.latest_version(name);
    DependencyResolver resolver(index_);
    ResolutionPlan plan = resolver.resolve(name, pinned, ledger_.all_installed());
    plan.erase(name);
    return plan;
}

// Removal follows the package's forward dependencies. The closure is walked
// from scratch, then each name reached is pinned at its installed version.
ResolutionPlan PackageManager::plan_removal(const std::string& name, const std::string& version) const {
    if (!index_.contains(name, version)) {
        log_warning(string_format("warning.dependencies_unknown", name, version));
        return {};
    }
    DependencyResolver resolver(index_);
    const ResolutionPlan closure = resolver.resolve(name, version, {});
    const auto installed = ledger_.all_installed();

    ResolutionPlan plan;
    for (const auto& [dep_name, dep_version] : closure) {
        if (dep_name == name) continue;
        if (auto it = installed.find(dep_name); it != installed.end()) {
            plan.add(dep_name, it->second);
        }
    }
    return plan;
}

void PackageManager::confirm_and_apply(const ResolutionPlan& plan, Operation operation, bool auto_confirm) {
    const bool installing = operation == Operation::install;
    const auto installed = ledger_.all_installed();

    ResolutionPlan pending;
    for (const auto& [name, version] : plan) {
        const auto it = installed.find(name);
        const bool installed_at_pin = it != installed.end() && version_cmp(it->second, version) == 0;
        if (installing && !installed_at_pin) {
            pending.add(name, version);
        } else if (!installing && installed_at_pin) {
            pending.add(name, version);
        }
    }
    if (pending.empty()) return;

    if (!auto_confirm) {
        log_info(get_string(installing ? "info.dependencies_to_install" : "info.dependencies_to_remove"));
        for (const auto& [name, version] : pending) {
            log_info(string_format("info.plan_entry", name, version));
        }
        // Installing defaults to yes, removing defaults to no.
        if (!user_confirms(get_string("prompt.continue"), installing)) {
            log_info(get_string("info.operation_cancelled"));
            throw OperationCancelled(get_string("error.operation_cancelled"));
        }
    }

    for (const auto& [name, version] : pending) {
        if (installing) {
            install_package(name, version);
        } else {
            remove_package(name, true);
        }
    }
}

void PackageManager::install_package(const std::string& name, const std::optional<std::string>& version) {
    PackageMetadata metadata;
    if (fs::is_regular_file(name)) {
        metadata = lifecycle_.inspect_archive(name);
        index_.add(metadata);
    } else {
        metadata = index_.metadata_for(name, version);
    }
    log_info(string_format("info.installing_package", metadata.name, metadata.version));

    std::optional<std::string> current;
    const auto installed = ledger_.all_installed();
    if (auto it = installed.find(metadata.name); it != installed.end()) {
        current = it->second;
    }
    if (current && version_cmp(*current, metadata.version) == 0) {
        log_info(string_format("info.package_already_installed", metadata.name, *current));
        return;
    }

    // Planning first: a resolution failure leaves the ledger untouched.
    const ResolutionPlan dependencies = plan_install(metadata.name, metadata.version);
    confirm_and_apply(dependencies, Operation::install, options_.assume_yes);

    if (current) {
        log_info(string_format("info.replacing_version", metadata.name, *current, metadata.version));
        remove_package(metadata.name, true);
    }
    run_install_lifecycle(metadata);
}

void PackageManager::run_install_lifecycle(const PackageMetadata& metadata) {
    ledger_.record_transition(metadata.name, metadata.version, DesiredState::marked_for_install, CurrentState::not_installed);

    const fs::path archive = lifecycle_.fetch(metadata);
    const fs::path staging = lifecycle_.unpack(metadata, archive);
    ledger_.record_transition(metadata.name, metadata.version, DesiredState::marked_for_install, CurrentState::unpacked);

    ledger_.record_transition(metadata.name, metadata.version, DesiredState::marked_for_install, CurrentState::partially_installed);
    lifecycle_.configure(metadata, staging);
    registry_.publish(metadata);
    ledger_.record_transition(metadata.name, metadata.version, DesiredState::marked_for_install, CurrentState::installed, current_timestamp());

    lifecycle_.cleanup(metadata);
    log_info(string_format("info.package_installed", metadata.name, metadata.version));
}

void PackageManager::remove_package(const std::string& name, bool force) {
    const std::string version = ledger_.installed_version(name);

    if (!force) {
        const ResolutionPlan dependencies = plan_removal(name, version);
        confirm_and_apply(dependencies, Operation::remove, options_.assume_yes);
    }
    run_remove_lifecycle(metadata_for_removal(name, version));
}

PackageMetadata PackageManager::metadata_for_removal(const std::string& name, const std::string& version) const {
    if (auto recorded = lifecycle_.installed_metadata(name)) {
        return *recorded;
    }
    if (index_.contains(name, version)) {
        return index_.metadata_for(name, version);
    }
    PackageMetadata metadata;
    metadata.name = name;
    metadata.version = version;
    return metadata;
}

void PackageManager::run_remove_lifecycle(const PackageMetadata& metadata) {
    log_info(string_format("info.removing_package", metadata.name, metadata.version));

    ledger_.record_transition(metadata.name, metadata.version, DesiredState::marked_for_removal, CurrentState::installed);
    registry_.unpublish(metadata.name);
    ledger_.record_transition(metadata.name, metadata.version, DesiredState::marked_for_removal, CurrentState::partially_installed);

    lifecycle_.deconfigure(metadata);
    ledger_.record_transition(metadata.name, metadata.version, DesiredState::unknown, CurrentState::not_installed, current_timestamp());

    log_info(string_format("info.package_removed", metadata.name, metadata.version));
}

std::map<std::string, std::string> PackageManager::upgrade(const std::optional<std::map<std::string, std::string>>& installed) {
    const std::map<std::string, std::string> current = installed ? *installed : ledger_.all_installed();
    std::map<std::string, std::string> result = current;

    for (const auto& [name, version] : current) {
        if (!index_.contains(name)) continue;

        const std::string latest = index_.latest_version(name);
        if (version_cmp(latest, version) <= 0) continue;

        log_info(string_format("info.upgrading_package", name, version, latest));
        install_package(name, latest);
        result[name] = latest;
    }

    if (result == current) {
        log_info(get_string("info.all_up_to_date"));
    }
    return result;
}

std::vector<PackageMetadata> PackageManager::list(bool summary) const {
    const auto packages = registry_.published();
    print_packages(packages, summary);
    return packages;
}

std::vector<PackageMetadata> PackageManager::search(const std::string& query, bool summary) const {
    const auto matches = index_.search(query);
    print_packages(matches, summary);
    return matches;
}

bool PackageManager::is_installed(const std::string& name) const {
    return ledger_.is_installed(name);
}

bool PackageManager::status(const std::string& name) const {
    const auto records = ledger_.status_of(name);
    if (records.empty()) {
        log_info(string_format("info.never_installed", name));
        return false;
    }

    auto chosen = records.begin();
    for (auto it = records.begin(); it != records.end(); ++it) {
        if (it->second.desired == DesiredState::marked_for_install && it->second.current == CurrentState::installed) {
            chosen = it;
            break;
        }
    }
    const auto& [version, record] = *chosen;

    if (index_.contains(name, version)) {
        const PackageMetadata& m = index_.metadata_for(name, version);
        print_package(m, false);
        if (m.filename) std::cout << string_format("info.field_filename", *m.filename) << "\n";
        if (m.hash) std::cout << string_format("info.field_hash", *m.hash) << "\n";
    } else if (auto recorded = lifecycle_.installed_metadata(name)) {
        print_package(*recorded, false);
    } else {
        std::cout << string_format("info.field_name", name) << "\n";
        std::cout << string_format("info.field_version", version) << "\n";
    }

    std::cout << string_format("info.field_desired", to_code(record.desired), to_string(record.desired)) << "\n";
    std::cout << string_format("info.field_current", to_code(record.current), to_string(record.current)) << "\n";
    if (record.install_date) {
        std::cout << string_format("info.field_install_date", *record.install_date) << "\n";
    }
    if (record.remove_date) {
        std::cout << string_format("info.field_remove_date", *record.remove_date) << "\n";
    }
    return true;
}

void PackageManager::clean() {
    std::error_code ec;
    fs::remove_all(TEMP_DIR, ec);
    if (ec) {
        throw PmsException(string_format("error.clean_failed", TEMP_DIR.string(), ec.message()));
    }
    ensure_dir_exists(TEMP_DIR);
    log_info(string_format("info.temp_cleaned", TEMP_DIR.string()));

    if (fs::exists(REPO_CACHE_FILE)) {
        fs::remove(REPO_CACHE_FILE);
        log_info(string_format("info.cache_removed", REPO_CACHE_FILE.string()));
    }
}
