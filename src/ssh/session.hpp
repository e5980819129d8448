#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// SessionManager: one SSH connection with an interactive PTY shell.
//
// establish() connects, authenticates (public key file if configured, then
// keyboard-interactive, then password) and opens a shell sized to the local
// terminal. All libssh2 calls on the session go through io_mutex().
class SessionManager {
public:
    explicit SessionManager(const SessionConfig& config);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();

    // Propagate a local terminal resize to the remote PTY.
    void resize(int cols, int rows);

    LIBSSH2_CHANNEL* get_channel() { return channel_; }
    int get_socket() const { return sock_; }
    const std::string& get_target() const { return target_str_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    SessionConfig config_;
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_;
    int sock_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult establish_connection(StatusCallback callback);
    SSHResult ssh_userauth(StatusCallback callback);
    SSHResult open_shell(StatusCallback callback);
    SSHResult fail(const std::string& reason);
};
