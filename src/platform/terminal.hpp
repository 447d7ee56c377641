#pragma once

#include <string>

namespace platform {

// RAII guard that turns off terminal echo on stdin.
// Destructor restores the saved mode.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
#ifdef _WIN32
    unsigned long old_mode_ = 0;
#else
    struct Impl;
    Impl* impl_ = nullptr;
#endif
};

// True if stdout is attached to a terminal.
bool stdout_is_tty();

// Print prompt to stderr and read one line from stdin with echo off.
std::string read_password(const std::string& prompt);

} // namespace platform
