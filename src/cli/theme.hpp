#pragma once

#include <string>
#include <core/constants.hpp>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string RED       = "\033[91m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// ── Layout ──────────────────────────────────────────────

inline std::string section(const std::string& title) {
    return "\n" + color::BLUE + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// One usage row: command in blue, description dimmed.
inline std::string usage_row(const std::string& cmd, const std::string& desc) {
    return color::BLUE + fmt::format("    {:<22}", cmd) + color::RESET
         + color::DIM + desc + color::RESET + "\n";
}

inline std::string version_line() {
    return color::BLUE + color::BOLD + "ctlssh" + color::RESET
         + color::DIM + " version " + CTLSSH_VERSION + color::RESET + "\n";
}

// ── Status indicators ───────────────────────────────────
// Written to stderr while the remote side may own the terminal, so lines
// end in \r\n.

inline std::string fail(const std::string& msg) {
    return color::RED + "ctlssh: " + color::RESET + msg + "\r\n";
}

} // namespace theme
