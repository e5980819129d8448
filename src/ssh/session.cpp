#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <cstring>
#include <fmt/format.h>

// Password handed to the keyboard-interactive callback via the session
// abstract pointer.
struct KbdAuthData {
    std::string password;
    StatusCallback callback;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        if (data->callback && prompt_text.find("assword") != std::string::npos) {
            data->callback("Sending password...");
        }
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

SessionManager::SessionManager(const SessionConfig& config)
    : config_(config), session_(nullptr), channel_(nullptr), sock_(-1),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::establish(StatusCallback callback) {
    auto result = establish_connection(callback);
    if (result.failed()) {
        echoterm_log_ssh("establish", result);
    }
    return result;
}

// Tear down whatever was set up so far and report why.
SSHResult SessionManager::fail(const std::string& reason) {
    close();
    return SSHResult{-1, "", reason};
}

SSHResult SessionManager::establish_connection(StatusCallback callback) {
    if (config_.host.empty()) {
        return SSHResult{-1, "", "No host configured"};
    }
    if (config_.user.empty()) {
        return SSHResult{-1, "", "No user configured"};
    }

    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", config_.host, config_.port));
    }

    if (libssh2_init(0) != 0) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    auto conn = platform::connect_tcp(config_.host, config_.port, config_.timeout * 1000);
    if (conn.is_err()) {
        return SSHResult{-1, "", conn.error};
    }
    sock_ = conn.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return fail("Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (ret != 0) {
        return fail("SSH handshake failed");
    }

    // Send SSH keepalive every 30s
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        close();
        return auth_result;
    }

    auto shell_result = open_shell(callback);
    if (shell_result.failed()) {
        close();
        return shell_result;
    }

    target_str_ = config_.user + "@" + config_.host;
    echoterm_log("Connected to " + target_str_);

    if (callback) {
        callback("Connected to " + config_.host);
    }

    return SSHResult{0, "", ""};
}

SSHResult SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;
    const std::string& user = config_.user;
    const std::string password = config_.password.value_or("");

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return SSHResult{0, "", ""};  // "none" auth accepted
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    std::string methods = auth_list ? auth_list : "";
    echoterm_log("Auth methods: " + methods);

    if (config_.ssh_key_path && methods.find("publickey") != std::string::npos) {
        if (callback) callback("Using public key " + *config_.ssh_key_path + "...");

        while ((ret = libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                config_.ssh_key_path->c_str(), password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
        echoterm_log(fmt::format("publickey auth failed rc={}", ret));
    }

    if (password.empty()) {
        return SSHResult{-1, "", "Authentication failed (no password and key rejected)"};
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data{password, callback};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                user.c_str(), password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed (check user/password)"};
}

SSHResult SessionManager::open_shell(StatusCallback callback) {
    while ((channel_ = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return SSHResult{-1, "", "Failed to open SSH channel"};
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    // PTY sized to the local terminal
    auto size = platform::term_size();
    int ret;
    while ((ret = libssh2_channel_request_pty_ex(
                channel_, config_.term.c_str(), static_cast<unsigned int>(config_.term.size()),
                nullptr, 0, size.cols, size.rows, 0, 0)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (ret != 0) {
        return SSHResult{-1, "", "Failed to request PTY"};
    }

    while ((ret = libssh2_channel_shell(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (ret != 0) {
        return SSHResult{-1, "", "Failed to request shell"};
    }

    if (callback) callback("Shell ready");
    return SSHResult{0, "", ""};
}

void SessionManager::resize(int cols, int rows) {
    if (!channel_) return;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    while (libssh2_channel_request_pty_size(channel_, cols, rows) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(1);
    }
}

void SessionManager::close() {
    // Each libssh2 call gets its own brief lock; disconnect does network I/O.
    if (channel_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_channel_close(channel_);
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_channel_free(channel_);
        }
        channel_ = nullptr;
    }

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}
