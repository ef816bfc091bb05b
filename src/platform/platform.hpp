#pragma once

#include <string>
#include <filesystem>
#include <optional>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Directory holding the running executable, if it can be determined.
std::optional<std::filesystem::path> executable_dir();

// Value of an environment variable, or nullopt when unset or empty.
std::optional<std::string> getenv_nonempty(const char* name);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
