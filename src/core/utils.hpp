#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Read a whole file as bytes. Err carries the path.
Result<std::string> read_text_file(const std::filesystem::path& path);

// Replace a file's contents. Err carries the path.
Result<void> write_text_file(const std::filesystem::path& path, const std::string& content);

// Join strings with a separator, e.g. for "a, b, c" listings.
std::string join(const std::vector<std::string>& parts, const std::string& sep);
