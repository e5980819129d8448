#include "terminal.hpp"

#include <iostream>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <signal.h>

namespace platform {

// ── Terminal queries ─────────────────────────────────────────

TermSize term_size() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0)
        return {ws.ws_col, ws.ws_row};
    return {80, 24};
}

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) == 1;
}

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

RawModeGuard::RawModeGuard(Mode mode) : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;  // not a tty
    impl_->saved = true;

    struct termios raw = impl_->old_term;
    if (mode == kFullRaw) {
        cfmakeraw(&raw);
    } else {
        raw.c_lflag &= ~(ECHO | ECHONL);
    }
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

RawModeGuard::~RawModeGuard() {
    if (impl_->saved) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
    }
    delete impl_;
}

std::string read_secret(const std::string& prompt) {
    std::cerr << prompt << std::flush;
    std::string line;
    {
        RawModeGuard guard(RawModeGuard::kNoEcho);
        std::getline(std::cin, line);
    }
    std::cerr << "\n";
    return line;
}

// ── Resize tracking ──────────────────────────────────────────

static volatile sig_atomic_t g_resize_flag = 0;
static struct sigaction g_old_sa;

static void sigwinch_handler(int) {
    g_resize_flag = 1;
}

void watch_terminal_resize() {
    g_resize_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigwinch_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGWINCH, &sa, &g_old_sa);
}

bool take_terminal_resize() {
    if (!g_resize_flag) return false;
    g_resize_flag = 0;
    return true;
}

void unwatch_terminal_resize() {
    sigaction(SIGWINCH, &g_old_sa, nullptr);
}

} // namespace platform
