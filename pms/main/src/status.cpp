#include "status.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

StatusRecord record_from_json(const json& entry) {
    if (!entry.is_object() || !entry.contains("status") || !entry["status"].is_object()) {
        throw InvalidStatus(get_string("error.status_entry_malformed"));
    }
    const json& status = entry["status"];

    StatusRecord record;
    record.desired = desired_from_code(status.value("desired", ""));
    record.current = current_from_code(status.value("current", ""));
    if (entry.contains("install_date") && entry["install_date"].is_string()) {
        record.install_date = entry["install_date"].get<std::string>();
    }
    if (entry.contains("remove_date") && entry["remove_date"].is_string()) {
        record.remove_date = entry["remove_date"].get<std::string>();
    }
    return record;
}

bool is_installed_entry(const json& entry) {
    const StatusRecord record = record_from_json(entry);
    return record.desired == DesiredState::marked_for_install && record.current == CurrentState::installed;
}

} // anonymous namespace

char to_code(DesiredState state) {
    switch (state) {
        case DesiredState::unknown: return 'u';
        case DesiredState::marked_for_install: return 'i';
        case DesiredState::marked_for_removal: return 'r';
    }
    throw InvalidStatus(string_format("error.invalid_desired_state", static_cast<int>(state)));
}

char to_code(CurrentState state) {
    switch (state) {
        case CurrentState::not_installed: return 'n';
        case CurrentState::unpacked: return 'u';
        case CurrentState::partially_installed: return 'h';
        case CurrentState::installed: return 'i';
    }
    throw InvalidStatus(string_format("error.invalid_current_state", static_cast<int>(state)));
}

DesiredState desired_from_code(std::string_view code) {
    if (code == "u") return DesiredState::unknown;
    if (code == "i") return DesiredState::marked_for_install;
    if (code == "r") return DesiredState::marked_for_removal;
    throw InvalidStatus(string_format("error.invalid_desired_state", std::string(code)));
}

CurrentState current_from_code(std::string_view code) {
    if (code == "n") return CurrentState::not_installed;
    if (code == "u") return CurrentState::unpacked;
    if (code == "h") return CurrentState::partially_installed;
    if (code == "i") return CurrentState::installed;
    throw InvalidStatus(string_format("error.invalid_current_state", std::string(code)));
}

std::string_view to_string(DesiredState state) {
    switch (state) {
        case DesiredState::unknown: return "unknown";
        case DesiredState::marked_for_install: return "marked for installation";
        case DesiredState::marked_for_removal: return "marked for removal";
    }
    return "?";
}

std::string_view to_string(CurrentState state) {
    switch (state) {
        case CurrentState::not_installed: return "not installed";
        case CurrentState::unpacked: return "unpacked";
        case CurrentState::partially_installed: return "partially installed";
        case CurrentState::installed: return "installed";
    }
    return "?";
}

StatusLedger::StatusLedger(fs::path path) : path_(std::move(path)) {}

json StatusLedger::load() const {
    if (!fs::exists(path_)) {
        return json::object();
    }
    try {
        json document = json::parse(read_file(path_));
        if (!document.is_object()) {
            throw InvalidStatus(string_format("error.status_file_corrupt", path_.string(), get_string("error.status_not_object")));
        }
        return document;
    } catch (const json::exception& e) {
        throw InvalidStatus(string_format("error.status_file_corrupt", path_.string(), e.what()));
    }
}

void StatusLedger::save(const json& document) const {
    write_file_atomic(path_, document.dump(2));
}

void StatusLedger::record_transition(const std::string& name, const std::string& version,
                                     DesiredState desired, CurrentState current,
                                     const std::optional<std::string>& date) {
    json document = load();

    json entry = {{"status", {{"desired", std::string(1, to_code(desired))}, {"current", std::string(1, to_code(current))}}}};
    if (date) {
        if (desired == DesiredState::marked_for_install && current == CurrentState::installed) {
            entry["install_date"] = *date;
        } else if (desired == DesiredState::unknown && current == CurrentState::not_installed) {
            entry["remove_date"] = *date;
        }
    }

    if (document.contains(name) && document[name].is_object() && document[name].contains(version)) {
        document[name][version] = std::move(entry);
    } else {
        document[name] = {{version, std::move(entry)}};
    }
    save(document);
}

void StatusLedger::record_transition(const std::string& name, const std::string& version,
                                     std::string_view desired, std::string_view current,
                                     const std::optional<std::string>& date) {
    record_transition(name, version, desired_from_code(desired), current_from_code(current), date);
}

std::string StatusLedger::installed_version(const std::string& name) const {
    const json document = load();
    if (auto it = document.find(name); it != document.end() && it->is_object()) {
        for (const auto& [version, entry] : it->items()) {
            if (is_installed_entry(entry)) {
                return version;
            }
        }
    }
    throw NotInstalled(string_format("error.package_not_installed", name));
}

std::map<std::string, std::string> StatusLedger::all_installed() const {
    std::map<std::string, std::string> installed;
    const json document = load();
    for (const auto& [name, versions] : document.items()) {
        if (!versions.is_object()) continue;
        for (const auto& [version, entry] : versions.items()) {
            if (is_installed_entry(entry)) {
                installed[name] = version;
                break;
            }
        }
    }
    return installed;
}

bool StatusLedger::is_installed(const std::string& name, const std::string& version) const {
    const json document = load();
    auto it = document.find(name);
    if (it == document.end() || !it->is_object()) return false;
    auto vit = it->find(version);
    return vit != it->end() && is_installed_entry(*vit);
}

bool StatusLedger::is_installed(const std::string& name) const {
    return all_installed().contains(name);
}

std::map<std::string, StatusRecord> StatusLedger::status_of(const std::string& name) const {
    std::map<std::string, StatusRecord> records;
    const json document = load();
    if (auto it = document.find(name); it != document.end() && it->is_object()) {
        for (const auto& [version, entry] : it->items()) {
            records.emplace(version, record_from_json(entry));
        }
    }
    return records;
}
