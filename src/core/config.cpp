#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".echoterm";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# echoterm configuration

session:
  host: ""
  port: 22
  user: ""
  # password: ""                   # Prompted for when neither this nor a key is set
  # ssh_key_path: "~/.ssh/id_ed25519"
  timeout: 30
  term: "xterm"

# Draw typed characters before the remote echoes them back
local_echo:
  enabled: true
  pause_ms: 500                    # Echo suppression after Tab / Ctrl-C
  pause_on_tab: true
  pause_on_interrupt: true

diagnostics:
  # dump_path: "~/.echoterm/mismatch.log"   # Mismatch log written on exit
  debug_log: true                  # Mirror mismatches to the temp-dir debug log
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

// Expand a leading "~/" to the home directory.
static std::string expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

static Result<SessionConfig> parse_session_config(const YAML::Node& node) {
    SessionConfig session;
    session.host = node["host"].as<std::string>("");
    session.port = node["port"].as<int>(22);
    if (session.port < 1 || session.port > 65535) {
        return Result<SessionConfig>::Err(
            "session.port out of range: " + std::to_string(session.port));
    }
    session.user = node["user"].as<std::string>("");
    session.timeout = node["timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);
    session.term = node["term"].as<std::string>("xterm");

    if (node["password"]) {
        session.password = node["password"].as<std::string>();
    }

    if (node["ssh_key_path"]) {
        std::string key = node["ssh_key_path"].as<std::string>("");
        if (!key.empty()) session.ssh_key_path = expand_home(key);
    }

    return Result<SessionConfig>::Ok(session);
}

static EchoConfig parse_echo_config(const YAML::Node& node) {
    EchoConfig echo;
    echo.enabled = node["enabled"].as<bool>(true);
    echo.pause_ms = node["pause_ms"].as<int>(DEFAULT_ECHO_PAUSE_MS);
    echo.pause_on_tab = node["pause_on_tab"].as<bool>(true);
    echo.pause_on_interrupt = node["pause_on_interrupt"].as<bool>(true);

    if (echo.pause_ms < 0) echo.pause_ms = 0;

    return echo;
}

static DiagnosticsConfig parse_diagnostics_config(const YAML::Node& node) {
    DiagnosticsConfig diag;
    diag.dump_path = expand_home(node["dump_path"].as<std::string>(""));
    diag.debug_log = node["debug_log"].as<bool>(true);
    return diag;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        const YAML::Node root = YAML::Load(yaml_text);

        Config config;
        auto session = parse_session_config(root["session"] ? root["session"] : YAML::Node());
        if (session.is_err()) {
            return Result<Config>::Err(session.error);
        }
        config.session_ = session.value;
        config.echo_ = parse_echo_config(root["local_echo"] ? root["local_echo"] : YAML::Node());
        config.diagnostics_ = parse_diagnostics_config(
            root["diagnostics"] ? root["diagnostics"] : YAML::Node());

        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto result = parse(text);
    if (result.is_err()) {
        return Result<Config>::Err(result.error + " (" + path.string() + ")");
    }
    return result;
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Global config not found at " + get_global_config_path().string());
    }
    return load_file(get_global_config_path());
}

Result<void> Config::apply_target(const std::string& target) {
    std::string rest = target;
    trim(rest);
    if (rest.empty()) {
        return Result<void>::Err("Empty connection target");
    }

    auto at = rest.find('@');
    if (at != std::string::npos) {
        session_.user = rest.substr(0, at);
        rest = rest.substr(at + 1);
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        int port = safe_stoi(rest.substr(colon + 1), -1);
        if (port <= 0 || port > 65535) {
            return Result<void>::Err("Invalid port in target: " + target);
        }
        session_.port = port;
        rest = rest.substr(0, colon);
    }

    if (rest.empty()) {
        return Result<void>::Err("Missing host in target: " + target);
    }
    session_.host = rest;
    return Result<void>::Ok();
}
