#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

enum class CliAction {
    Run,
    Init,          // write a default ~/.fleetcmd/config.yaml
    Credentials,   // credentials list|set|remove
    Help,
    Version,
};

struct CliOptions {
    CliAction action = CliAction::Run;

    std::vector<std::string> hosts;
    std::string command;
    bool stream = false;
    bool no_header = false;
    bool no_host = false;

    // Overrides for config values; unset means "use the config file"
    std::optional<bool> gzip;
    std::optional<int> port;
    std::optional<std::string> user;
    std::optional<std::string> key;
    std::optional<std::string> config_path;

    std::vector<std::string> sub_args;  // arguments after "credentials"
};

// Parse argv[1..]. Hosts come from -H/--hosts (comma-separated, repeatable)
// and from positional arguments; the command from -c/--command or from
// everything after "--".
Result<CliOptions> parse_args(const std::vector<std::string>& args);
