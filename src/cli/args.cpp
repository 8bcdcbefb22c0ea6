#include "args.hpp"
#include <core/utils.hpp>
#include <util/string_utils.hpp>

static void add_hosts(CliOptions& opts, const std::string& list) {
    for (auto host : StringUtils::split(list, ',')) {
        trim(host);
        if (!host.empty()) opts.hosts.push_back(host);
    }
}

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    CliOptions opts;

    if (!args.empty()) {
        if (args[0] == "init") {
            opts.action = CliAction::Init;
            return Result<CliOptions>::Ok(opts);
        }
        if (args[0] == "credentials") {
            opts.action = CliAction::Credentials;
            opts.sub_args.assign(args.begin() + 1, args.end());
            return Result<CliOptions>::Ok(opts);
        }
    }

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        // Fetch the value of an option that takes one
        auto value = [&](std::string& out) -> bool {
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };
        std::string v;

        if (arg == "--") {
            std::vector<std::string> rest(args.begin() + i + 1, args.end());
            opts.command = StringUtils::join(rest, " ");
            break;
        } else if (arg == "-h" || arg == "--help") {
            opts.action = CliAction::Help;
            return Result<CliOptions>::Ok(opts);
        } else if (arg == "--version") {
            opts.action = CliAction::Version;
            return Result<CliOptions>::Ok(opts);
        } else if (arg == "-H" || arg == "--hosts") {
            if (!value(v)) return Result<CliOptions>::Err(arg + " needs a host list");
            add_hosts(opts, v);
        } else if (arg == "-c" || arg == "--command") {
            if (!value(v)) return Result<CliOptions>::Err(arg + " needs a command");
            opts.command = v;
        } else if (arg == "-p" || arg == "--port") {
            if (!value(v)) return Result<CliOptions>::Err(arg + " needs a port");
            int port = safe_stoi(v, -1);
            if (port <= 0 || port > 65535) {
                return Result<CliOptions>::Err("Invalid port: " + v);
            }
            opts.port = port;
        } else if (arg == "-u" || arg == "--user") {
            if (!value(v)) return Result<CliOptions>::Err(arg + " needs a user name");
            opts.user = v;
        } else if (arg == "-i" || arg == "--key") {
            if (!value(v)) return Result<CliOptions>::Err(arg + " needs a key path");
            opts.key = v;
        } else if (arg == "--config") {
            if (!value(v)) return Result<CliOptions>::Err(arg + " needs a path");
            opts.config_path = v;
        } else if (arg == "-s" || arg == "--stream") {
            opts.stream = true;
        } else if (arg == "-z" || arg == "--gzip") {
            opts.gzip = true;
        } else if (arg == "--no-gzip") {
            opts.gzip = false;
        } else if (arg == "--no-header") {
            opts.no_header = true;
        } else if (arg == "--no-host") {
            opts.no_host = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return Result<CliOptions>::Err("Unknown option: " + arg);
        } else {
            add_hosts(opts, arg);
        }
    }

    if (opts.hosts.empty()) {
        return Result<CliOptions>::Err("No hosts given");
    }
    if (opts.command.empty()) {
        return Result<CliOptions>::Err("No command given");
    }
    return Result<CliOptions>::Ok(opts);
}
