#pragma once

#include <string>

namespace platform {

struct TermSize {
    int cols;
    int rows;
};

// Current size of the controlling terminal (80x24 when not a tty).
TermSize term_size();

// True when stdin is a terminal.
bool stdin_is_tty();

// RAII guard for raw terminal mode.
// Constructor saves current mode and enters raw mode.
// Destructor restores the saved mode.
struct RawModeGuard {
    enum Mode {
        kFullRaw,   // cfmakeraw equivalent (interactive relay)
        kNoEcho,    // Canonical on, echo off (password input)
    };

    explicit RawModeGuard(Mode mode = kFullRaw);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Prompt on stderr and read one line from stdin without echoing it.
std::string read_secret(const std::string& prompt);

// SIGWINCH tracking. watch_terminal_resize() installs the handler,
// take_terminal_resize() reports (and clears) a pending resize,
// unwatch_terminal_resize() restores the previous handler.
void watch_terminal_resize();
bool take_terminal_resize();
void unwatch_terminal_resize();

} // namespace platform
