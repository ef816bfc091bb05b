#pragma once

#include <string>

// Project name grammar: ^[A-Za-z0-9_]+$ (ASCII only).
// Always a safe single path component. A leading digit is accepted even
// though such a name cannot be imported as a Python module.
bool is_valid_project_name(const std::string& name);

// Human-readable form of the grammar for error messages.
constexpr const char* PROJECT_NAME_PATTERN = "^[a-zA-Z0-9_]+$";
