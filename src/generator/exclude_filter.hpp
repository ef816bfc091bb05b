#pragma once

#include <string>
#include <vector>
#include <regex>

// Matches single path components (file or directory names) against a list of
// exact names and shell globs ("*", "?"). A matching directory is skipped
// together with its whole subtree by the copier.
class ExcludeFilter {
public:
    // Starts with DEFAULT_EXCLUDES.
    ExcludeFilter();
    explicit ExcludeFilter(const std::vector<std::string>& patterns);

    void add_pattern(const std::string& pattern);

    bool is_excluded(const std::string& name) const;

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_;
    std::vector<std::string> exact_;
    std::vector<std::regex> globs_;

    static std::string glob_to_regex(const std::string& glob);
};
