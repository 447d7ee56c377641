#pragma once

#include <cstddef>
#include <string>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string CYAN      = "\033[36m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Wrap s in a color when enabled (stdout is a terminal), else return it as is.
inline std::string paint(bool enabled, const std::string& code, const std::string& s) {
    return enabled ? code + s + color::RESET : s;
}

inline std::string cyan(bool on, const std::string& s)   { return paint(on, color::CYAN, s); }
inline std::string green(bool on, const std::string& s)  { return paint(on, color::GREEN, s); }
inline std::string red(bool on, const std::string& s)    { return paint(on, color::RED, s); }
inline std::string bold(bool on, const std::string& s)   { return paint(on, color::BOLD, s); }
inline std::string dim(bool on, const std::string& s)    { return paint(on, color::DIM, s); }

// ── Status tags ─────────────────────────────────────────

inline std::string progress(bool on, size_t n) {
    return cyan(on, "[" + bold(on, std::to_string(n)) + "]");
}

inline std::string success(bool on) {
    return green(on, "[" + bold(on, "SUCCESS") + "]");
}

inline std::string failure(bool on) {
    return red(on, "[" + bold(on, "FAILURE") + "]");
}

// One-line error for stderr
inline std::string fail(const std::string& msg) {
    return "fanout: " + msg + "\n";
}

} // namespace theme
