#pragma once

#include <string>
#include <optional>
#include <functional>
#include <utility>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH operation result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Configuration structures
struct SessionConfig {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> ssh_key_path;
    int timeout = 30;
    std::string term = "xterm";
};

struct EchoConfig {
    bool enabled = true;
    int pause_ms = 500;               // echo suppression after Tab / Ctrl-C
    bool pause_on_tab = true;         // completion output never mirrors keystrokes
    bool pause_on_interrupt = true;
};

struct DiagnosticsConfig {
    std::string dump_path;            // mismatch log written here on exit (optional)
    bool debug_log = true;            // mirror mismatches to echoterm_debug.log
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
