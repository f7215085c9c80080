#include "slate_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <iostream>

SlateCLI::SlateCLI(std::optional<std::filesystem::path> config_path)
    : BaseCLI(std::move(config_path)) {
    register_transfer_commands(*this);
    register_setup_commands(*this);
}

void print_usage(const SlateCLI& cli) {
    std::cout << theme::banner();
    cli.print_help();
    std::cout << theme::color::DIM
              << "    --config PATH         Use this config file instead of ~/.slate/config.yaml\n"
              << "    slate --version       Show version\n"
              << "    slate --help          Show this help"
              << theme::color::RESET << "\n\n";
}

int run_slate(const std::vector<std::string>& argv) {
    // --config may appear anywhere; everything else is positional to the command
    std::optional<std::filesystem::path> config_path;
    std::vector<std::string> args;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (argv[i] == "--config") {
            if (i + 1 >= argv.size()) {
                std::cout << theme::fail("Missing value for --config");
                return 1;
            }
            config_path = expand_home(argv[++i]);
        } else {
            args.push_back(argv[i]);
        }
    }

    SlateCLI cli(config_path);

    if (args.empty()) {
        std::cout << theme::fail("No command specified");
        print_usage(cli);
        return 1;
    }
    if (args[0] == "--help" || args[0] == "help") {
        print_usage(cli);
        return 0;
    }
    if (args[0] == "--version") {
        std::cout << theme::color::SLATE << theme::color::BOLD << "slate"
                  << theme::color::RESET << theme::color::DIM
                  << " version " << SLATE_VERSION << theme::color::RESET << "\n";
        return 0;
    }

    std::string cmd = args[0];
    args.erase(args.begin());
    return cli.execute_command(cmd, args);
}
