#include "version.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <string_view>
#include <vector>

namespace {
const std::regex version_regex(R"(^(\d+)(\.\d+)*(-[0-9A-Za-z-]+(\.[0-9A-Za-z-]+)*)?(\+[0-9A-Za-z-]+(\.[0-9A-Za-z-]+)*)?$)");

void validate_version_format(const std::string& version_str) {
    if (!std::regex_match(version_str, version_regex)) {
        throw PmsException(string_format("error.invalid_version_format", version_str));
    }
}

std::vector<std::string> split_dots(std::string_view sv) {
    std::vector<std::string> parts;
    size_t start = 0, end = 0;
    while ((end = sv.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(sv.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(sv.substr(start));
    return parts;
}

struct Version {
    std::vector<int> main_part;
    std::vector<std::string> pre_release_part;

    explicit Version(const std::string& version_str) {
        std::string_view v_sv(version_str);
        const size_t build_meta_pos = v_sv.find('+');
        if (build_meta_pos != std::string_view::npos) v_sv = v_sv.substr(0, build_meta_pos);

        const size_t pre_release_pos = v_sv.find('-');
        for (const auto& part : split_dots(v_sv.substr(0, pre_release_pos))) {
            try {
                main_part.push_back(std::stoi(part));
            } catch (const std::exception& e) {
                throw PmsException(string_format("error.invalid_version_format", version_str) + ": " + e.what());
            }
        }

        if (pre_release_pos != std::string_view::npos) {
            pre_release_part = split_dots(v_sv.substr(pre_release_pos + 1));
        }
    }
};

bool is_numeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

int compare_pre_release_part(const std::vector<std::string>& p1, const std::vector<std::string>& p2) {
    const size_t min_len = std::min(p1.size(), p2.size());
    for (size_t i = 0; i < min_len; ++i) {
        const bool is_num1 = is_numeric(p1[i]);
        const bool is_num2 = is_numeric(p2[i]);

        if (is_num1 && is_num2) {
            // Compare by length first so long identifiers cannot overflow
            const std::string a = p1[i].substr(std::min(p1[i].find_first_not_of('0'), p1[i].size()));
            const std::string b = p2[i].substr(std::min(p2[i].find_first_not_of('0'), p2[i].size()));
            if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
            if (int res = a.compare(b); res != 0) return res < 0 ? -1 : 1;
        } else if (is_num1) {
            return -1; // Numeric identifiers have lower precedence than non-numeric identifiers.
        } else if (is_num2) {
            return 1;
        } else if (int res = p1[i].compare(p2[i]); res != 0) {
            return res < 0 ? -1 : 1;
        }
    }

    if (p1.size() < p2.size()) return -1;
    if (p1.size() > p2.size()) return 1;
    return 0;
}

}

int version_cmp(const std::string& v1_str, const std::string& v2_str) {
    validate_version_format(v1_str);
    validate_version_format(v2_str);

    const Version v1(v1_str);
    const Version v2(v2_str);

    const size_t main_len = std::max(v1.main_part.size(), v2.main_part.size());
    for (size_t i = 0; i < main_len; ++i) {
        int n1 = (i < v1.main_part.size()) ? v1.main_part[i] : 0;
        int n2 = (i < v2.main_part.size()) ? v2.main_part[i] : 0;
        if (n1 < n2) return -1;
        if (n1 > n2) return 1;
    }

    if (!v1.pre_release_part.empty() && v2.pre_release_part.empty()) {
        return -1; // A pre-release version has lower precedence than a normal version.
    }
    if (v1.pre_release_part.empty() && !v2.pre_release_part.empty()) {
        return 1;
    }
    return compare_pre_release_part(v1.pre_release_part, v2.pre_release_part);
}

bool version_compare(const std::string& v1_str, const std::string& v2_str) {
    return version_cmp(v1_str, v2_str) < 0;
}

bool version_satisfies(const std::string& current_version, const std::string& op, const std::string& required_version) {
    if (op == "=") return version_cmp(current_version, required_version) == 0;
    if (op == ">") return version_cmp(current_version, required_version) > 0;
    if (op == "<") return version_cmp(current_version, required_version) < 0;
    if (op == ">=") return version_cmp(current_version, required_version) >= 0;
    if (op == "<=") return version_cmp(current_version, required_version) <= 0;
    return false;
}

bool is_valid_version(const std::string& version_str) {
    return std::regex_match(version_str, version_regex);
}
