#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "args.hpp"

class Config;
class CredentialManager;

class FleetCLI {
public:
    FleetCLI(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Dispatch on the parsed action; returns the process exit code.
    int run(const CliOptions& opts);

    int run_command(const CliOptions& opts);
    int run_init();
    int run_credentials(const std::vector<std::string>& args);
    void print_usage();
    void print_version();

private:
    std::ostream& out_;
    std::ostream& err_;

    Result<Config> load_config(const CliOptions& opts);
    int run_capture(const CliOptions& opts, const Config& config);
    int run_stream(const CliOptions& opts, const Config& config);
};
