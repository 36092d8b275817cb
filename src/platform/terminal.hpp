#pragma once

#include <string>

namespace platform {

// RAII guard that turns terminal echo off for secret input.
// Destructor restores the saved mode.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// True if stdin is attached to a terminal.
bool stdin_is_tty();

// Print prompt and read one line from stdin with echo disabled.
// Returns an empty string when stdin is not a terminal.
std::string read_secret(const std::string& prompt);

} // namespace platform
