#include "name_validator.hpp"

static bool is_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

bool is_valid_project_name(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!is_word_char(c)) return false;
    }
    return true;
}
