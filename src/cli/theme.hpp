#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// FastAPI teal and a warm accent (ANSI 24-bit escape sequences)
namespace color {
    const std::string TEAL      = "\033[38;2;5;153;139m";
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string AMBER     = "\033[38;2;209;140;42m";
    const std::string WHITE     = "\033[97m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string CYAN      = "\033[96m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string blue(const std::string& s)   { return color::BLUE + color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)  { return color::GREEN + color::BOLD + s + color::RESET; }
inline std::string cyan(const std::string& s)   { return color::CYAN + s + color::RESET; }
inline std::string yellow(const std::string& s) { return color::YELLOW + color::BOLD + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Title line with version
inline std::string banner(const std::string& version) {
    return "\n" + color::TEAL + color::BOLD + "  apigen" + color::RESET
         + color::DIM + "  v" + version + "  FastAPI project generator"
         + color::RESET + "\n";
}

// Section header — blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Command with a one-line explanation underneath
inline std::string command(const std::string& cmd, const std::string& what) {
    return "    " + blue(cmd) + "\n    " + what + "\n\n";
}

// Key-value row, e.g. template listings
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<14}", key) + color::RESET + value + "\n";
}

} // namespace theme
