#include "exclude_filter.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <algorithm>

ExcludeFilter::ExcludeFilter() {
    for (const char* pattern : DEFAULT_EXCLUDES) {
        add_pattern(pattern);
    }
}

ExcludeFilter::ExcludeFilter(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        add_pattern(pattern);
    }
}

void ExcludeFilter::add_pattern(const std::string& raw) {
    std::string pattern = raw;
    trim(pattern);

    // Directory markers are meaningless here: we only ever match one component
    while (!pattern.empty() && pattern.back() == '/') {
        pattern.pop_back();
    }
    if (pattern.empty()) return;

    if (std::find(patterns_.begin(), patterns_.end(), pattern) != patterns_.end()) {
        return;
    }
    patterns_.push_back(pattern);

    if (pattern.find_first_of("*?") != std::string::npos) {
        globs_.emplace_back(glob_to_regex(pattern));
    } else {
        exact_.push_back(pattern);
    }
}

bool ExcludeFilter::is_excluded(const std::string& name) const {
    if (std::find(exact_.begin(), exact_.end(), name) != exact_.end()) {
        return true;
    }
    for (const auto& re : globs_) {
        if (std::regex_match(name, re)) {
            return true;
        }
    }
    return false;
}

std::string ExcludeFilter::glob_to_regex(const std::string& glob) {
    static const std::string special = "\\^$.|+()[]{}";
    std::string regex;

    for (char c : glob) {
        if (c == '*') {
            regex += ".*";
        } else if (c == '?') {
            regex += '.';
        } else if (special.find(c) != std::string::npos) {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }

    return regex;
}
