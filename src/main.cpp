#include <iostream>
#include <vector>
#include <string>
#include "cli/args.hpp"
#include "cli/fleet_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        FleetCLI cli;

        std::vector<std::string> args(argv + 1, argv + argc);
        if (args.empty()) {
            cli.print_usage();
            return 1;
        }

        auto parsed = parse_args(args);
        if (parsed.is_err()) {
            std::cerr << theme::fail(parsed.error);
            std::cerr << theme::step("Run 'fleetcmd --help' for usage");
            return 1;
        }
        return cli.run(parsed.value);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
