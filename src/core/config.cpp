#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / FLEETCMD_DIR_NAME;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / CONFIG_FILE_NAME;
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# fleetcmd configuration

server:
  default_port: 22                 # Used when a host is given without :port

# Compress remote output with gzip and decompress locally
gzip: false

auth:
  user: ""                         # Empty: $USER
  password: ""                     # Empty: credentials file key "password"
  private_key: ""                  # Empty: ~/.ssh/id_ed25519, ~/.ssh/id_rsa
  passphrase: ""                   # Empty: credentials file key "passphrase"

log:
  path: ""                         # Empty: <tmp>/fleetcmd_debug.log
)";

    try {
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

static ServerConfig parse_server_config(const YAML::Node& node) {
    ServerConfig server;
    server.default_port = node["default_port"].as<int>(DEFAULT_SSH_PORT);
    return server;
}

static AuthConfig parse_auth_config(const YAML::Node& node) {
    AuthConfig auth;
    auth.user = node["user"].as<std::string>("");
    auth.password = node["password"].as<std::string>("");
    auth.private_key = node["private_key"].as<std::string>("");
    auth.passphrase = node["passphrase"].as<std::string>("");
    return auth;
}

static LogConfig parse_log_config(const YAML::Node& node) {
    LogConfig log;
    log.path = node["path"].as<std::string>("");
    return log;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        config.server_ = parse_server_config(root["server"] ? root["server"] : YAML::Node());
        config.auth_ = parse_auth_config(root["auth"] ? root["auth"] : YAML::Node());
        config.log_ = parse_log_config(root["log"] ? root["log"] : YAML::Node());
        config.gzip_ = root["gzip"].as<bool>(false);

        if (config.server_.default_port <= 0 || config.server_.default_port > 65535) {
            return Result<Config>::Err("Invalid server.default_port: " +
                                       std::to_string(config.server_.default_port));
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file: " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        return Result<Config>::Err(path.string() + ": " + result.error);
    }
    return result;
}

Result<Config> Config::load_global() {
    return load(get_global_config_path());
}
