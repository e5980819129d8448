#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.echoterm/config.yaml
    static Result<Config> load_global();

    // Load config from an explicit file
    static Result<Config> load_file(const fs::path& path);

    // Parse config from YAML text
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const SessionConfig& session() const { return session_; }
    const EchoConfig& local_echo() const { return echo_; }
    const DiagnosticsConfig& diagnostics() const { return diagnostics_; }

    // Command-line overrides: [user@]host[:port]
    Result<void> apply_target(const std::string& target);

    Config() = default;

private:
    SessionConfig session_;
    EchoConfig echo_;
    DiagnosticsConfig diagnostics_;
};

// Helper to check if the config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
