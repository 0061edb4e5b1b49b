#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

using json = nlohmann::json;

// Operator intent. Persisted as u, i and r.
enum class DesiredState {
    unknown,
    marked_for_install,
    marked_for_removal
};

// Installation progress. Persisted as n, u, h and i.
enum class CurrentState {
    not_installed,
    unpacked,
    partially_installed,
    installed
};

char to_code(DesiredState state);
char to_code(CurrentState state);
// Throw InvalidStatus for anything but a known single-letter code.
DesiredState desired_from_code(std::string_view code);
CurrentState current_from_code(std::string_view code);

std::string_view to_string(DesiredState state);
std::string_view to_string(CurrentState state);

struct StatusRecord {
    DesiredState desired = DesiredState::unknown;
    CurrentState current = CurrentState::not_installed;
    std::optional<std::string> install_date;
    std::optional<std::string> remove_date;
};

// Persisted lifecycle state of every package version:
// {name: {version: {status: {desired, current}, install_date?, remove_date?}}}
// The file is created on the first transition and rewritten whole each time.
class StatusLedger {
public:
    explicit StatusLedger(std::filesystem::path path);

    // Replaces the record of (name, version), dropping its earlier dates. A
    // version not yet recorded for the package replaces all of its prior
    // versions. `date` becomes install_date on marked_for_install/installed
    // and remove_date on unknown/not_installed; it is ignored otherwise.
    void record_transition(const std::string& name, const std::string& version,
                           DesiredState desired, CurrentState current,
                           const std::optional<std::string>& date = std::nullopt);

    // Same, from persisted letter codes. Throws InvalidStatus on unknown codes.
    void record_transition(const std::string& name, const std::string& version,
                           std::string_view desired, std::string_view current,
                           const std::optional<std::string>& date = std::nullopt);

    // Throws NotInstalled when no version is marked_for_install/installed.
    std::string installed_version(const std::string& name) const;
    std::map<std::string, std::string> all_installed() const;
    bool is_installed(const std::string& name, const std::string& version) const;
    bool is_installed(const std::string& name) const;

    // Every recorded version of the package; empty when it was never seen.
    std::map<std::string, StatusRecord> status_of(const std::string& name) const;

    const std::filesystem::path& path() const { return path_; }

private:
    json load() const;
    void save(const json& document) const;

    std::filesystem::path path_;
};
