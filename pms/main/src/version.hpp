#pragma once

#include <string>

// Three-way comparison: negative, zero or positive as v1 is older, equal or newer.
// Throws PmsException on a malformed version string.
int version_cmp(const std::string& v1_str, const std::string& v2_str);

// True when v1 is strictly older than v2.
bool version_compare(const std::string& v1_str, const std::string& v2_str);

// op is one of "=", ">", "<", ">=", "<="; anything else never satisfies.
bool version_satisfies(const std::string& current_version, const std::string& op, const std::string& required_version);

bool is_valid_version(const std::string& version_str);

struct VersionLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return version_compare(a, b);
    }
};
