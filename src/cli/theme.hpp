#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string ORANGE    = "\033[38;2;243;118;38m";   // Jupyter orange
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }

// Section header: blank line before and after the title
inline std::string section(const std::string& title) {
    return "\n" + color::ORANGE + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "  + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "  x " + color::RESET + msg + "\n";
}

// Usage line: command, argument placeholder, description
inline std::string usage_row(const std::string& cmd, const std::string& args,
                             const std::string& help) {
    return color::BLUE + fmt::format("    {:<6}", cmd) + color::RESET
         + color::ORANGE + fmt::format("{:<20}", args) + color::RESET
         + color::DIM + help + color::RESET + "\n";
}

} // namespace theme
