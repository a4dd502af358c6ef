#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// cppforge palette (ANSI escape sequences)
// Forge orange: #E0752D
// Steel blue:   #4F7CAC
namespace color {
    const std::string ORANGE    = "\033[38;2;224;117;45m";
    const std::string STEEL     = "\033[38;2;79;124;172m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrapper
inline std::string dim(const std::string& s) { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Horizontal line only; callers control the gaps
inline std::string rule() {
    return color::DIM + "  \xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80" + color::RESET + "\n";
}

// Banner: tool name, version, rule
inline std::string banner(const std::string& version) {
    return "\n"
        + color::ORANGE + color::BOLD + "  cppforge\n"
        + color::RESET + color::DIM + "  v" + version
        + "  preset-driven CMake builds"
        + color::RESET + "\n\n"
        + rule();
}

// Section header with a blank line on either side
inline std::string section(const std::string& title) {
    return "\n" + color::ORANGE + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::STEEL + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::ORANGE + "    > " + color::RESET + msg + "\n";
}

// Key-value row for the resolved preset view
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<18}", key) + color::RESET + value + "\n";
}

// Command help row: name, then dimmed description
inline std::string command_row(const std::string& name, const std::string& help) {
    return color::STEEL + fmt::format("    {:<14}", name) + color::RESET
         + color::DIM + help + color::RESET + "\n";
}

} // namespace theme
