#include "shell_relay.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

// Write everything to stdout, retrying short writes.
static bool write_stdout(const std::string& text) {
    size_t done = 0;
    while (done < text.size()) {
        ssize_t w = ::write(STDOUT_FILENO, text.data() + done, text.size() - done);
        if (w < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return false;
        }
        done += static_cast<size_t>(w);
    }
    return true;
}

static void display(const std::string& text) {
    if (!write_stdout(text)) {
        echoterm_log(fmt::format("stdout write failed: {}", std::strerror(errno)));
    }
}

ShellRelay::ShellRelay(SessionManager& session, const EchoConfig& echo,
                       const DiagnosticsConfig& diag)
    : session_(session), diag_cfg_(diag),
      echo_(echo, display, [this](const std::string& data) { return send(data); }) {
    if (diag_cfg_.debug_log) {
        echo_.local_echo().diagnostics().set_mirror([](const std::string& msg) {
            echoterm_log("local-echo mismatch: " + msg);
        });
    }
}

// ── Relay loop ─────────────────────────────────────────────────

int ShellRelay::run() {
    LIBSSH2_CHANNEL* ch = session_.get_channel();
    if (!ch) return -1;
    auto io_mutex = session_.io_mutex();

    platform::watch_terminal_resize();
    int status = -1;
    {
        platform::RawModeGuard raw(platform::RawModeGuard::kFullRaw);

        auto size = platform::term_size();
        session_.resize(size.cols, size.rows);

        char rbuf[SSH_READ_BUF_SIZE];
        bool running = true;

        while (running) {
            if (platform::take_terminal_resize()) {
                size = platform::term_size();
                session_.resize(size.cols, size.rows);
            }

            struct pollfd fds[2];
            fds[0] = {STDIN_FILENO, POLLIN, 0};
            fds[1] = {session_.get_socket(), POLLIN, 0};
            int pr = poll(fds, 2, RELAY_POLL_MS);
            if (pr < 0 && errno != EINTR) {
                echoterm_log(fmt::format("poll failed: {}", std::strerror(errno)));
                break;
            }

            // stdin → channel (one read is one keystroke unless pasted)
            if (pr > 0 && (fds[0].revents & POLLIN)) {
                ssize_t n = ::read(STDIN_FILENO, rbuf, sizeof(rbuf));
                if (n <= 0) break;
                if (!echo_.handle_input(std::string(rbuf, static_cast<size_t>(n)))) {
                    echoterm_log("channel write failed");
                }
            }

            // channel → LocalEcho → stdout. Drained every pass: libssh2 may
            // hold decrypted data the socket no longer signals.
            for (;;) {
                ssize_t n;
                {
                    std::lock_guard<std::mutex> lock(*io_mutex);
                    n = libssh2_channel_read(ch, rbuf, sizeof(rbuf));
                }
                if (n == LIBSSH2_ERROR_EAGAIN || n == 0) break;
                if (n < 0) {
                    echoterm_log(fmt::format("channel read failed rc={}", n));
                    running = false;
                    break;
                }
                echo_.handle_output(std::string(rbuf, static_cast<size_t>(n)));
            }

            std::lock_guard<std::mutex> lock(*io_mutex);
            if (libssh2_channel_eof(ch)) {
                status = libssh2_channel_get_exit_status(ch);
                running = false;
            }
        }
    }
    platform::unwatch_terminal_resize();

    auto dumped = echo_.dump_diagnostics(diag_cfg_, session_.get_target());
    if (dumped.is_err()) echoterm_log(dumped.error);
    return status;
}

bool ShellRelay::send(const std::string& data) {
    LIBSSH2_CHANNEL* ch = session_.get_channel();
    auto io_mutex = session_.io_mutex();
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex);
            w = libssh2_channel_write(ch, data.data() + sent, data.size() - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) { platform::sleep_ms(1); continue; }
        if (w < 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}
