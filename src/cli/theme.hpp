#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string CYAN      = "\033[36m";
    const std::string AMBER     = "\033[38;2;214;158;46m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string banner() {
    return "\n" + color::CYAN + color::BOLD + "  echoterm" + color::RESET
         + color::DIM + fmt::format("  v{}  local-echo terminal", ECHOTERM_VERSION)
         + color::RESET + "\n";
}

// Section header with a blank line on each side
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Subtle log line for connection progress
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Usage row: command, arguments, description
inline std::string usage(const std::string& cmd, const std::string& args,
                         const std::string& desc) {
    size_t width = cmd.size() + (args.empty() ? 0 : args.size() + 1);
    std::string pad(width < 32 ? 32 - width : 2, ' ');
    return color::CYAN + "    " + cmd + color::RESET
         + color::AMBER + (args.empty() ? "" : " " + args) + color::RESET
         + pad + color::DIM + desc + color::RESET + "\n";
}

} // namespace theme
