#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from ~/.fleetcmd/config.yaml. Missing file → defaults.
    static Result<Config> load_global();

    // Load from an explicit path. Missing file → defaults.
    static Result<Config> load(const fs::path& path);

    // Parse YAML text directly (used by load and by tests)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const ServerConfig& server() const { return server_; }
    const AuthConfig& auth() const { return auth_; }
    const LogConfig& log() const { return log_; }
    bool gzip() const { return gzip_; }

    // Command-line overrides
    void set_default_port(int port) { server_.default_port = port; }
    void set_gzip(bool gzip) { gzip_ = gzip; }
    void set_user(const std::string& user) { auth_.user = user; }
    void set_private_key(const std::string& path) { auth_.private_key = path; }

    Config() = default;

private:
    ServerConfig server_;
    AuthConfig auth_;
    LogConfig log_;
    bool gzip_ = false;
};

// Helper to check if the config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
