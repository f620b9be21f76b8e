#include "cumulus_cli.hpp"
#include "theme.hpp"
#include <iostream>

static const char* CUMULUS_VERSION = "0.1.0";

CumulusCLI::CumulusCLI() : BaseCLI() {
    register_all_commands();
}

void CumulusCLI::register_all_commands() {
    register_cluster_commands(*this);
    register_shell_commands(*this);
}

void CumulusCLI::print_usage() const {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    cumulus "
              << theme::color::RESET << theme::color::BROWN << "[--config FILE] [-v] <command> [args]"
              << theme::color::RESET << "\n";
    print_help();
    std::cout << theme::color::DIM
              << "    cumulus --version        Show version\n"
              << "    cumulus --help           Show this help"
              << theme::color::RESET << "\n\n";
}

void CumulusCLI::print_version() const {
    std::cout << theme::color::BROWN << theme::color::BOLD << "cumulus"
              << theme::color::RESET << theme::color::DIM
              << " version " << CUMULUS_VERSION << theme::color::RESET << "\n";
}

int CumulusCLI::run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // Global flags come before the command
    size_t i = 0;
    while (i < args.size() && !args[i].empty() && args[i][0] == '-') {
        const std::string& flag = args[i];
        if (flag == "--version") {
            print_version();
            return 0;
        } else if (flag == "--help" || flag == "-h") {
            print_usage();
            return 0;
        } else if (flag == "-v" || flag == "--verbose") {
            verbose = true;
            i++;
        } else if (flag == "--config" || flag == "-c") {
            if (i + 1 >= args.size()) {
                std::cout << theme::fail("Missing value for " + flag);
                return 1;
            }
            config_path = args[i + 1];
            i += 2;
        } else {
            std::cout << theme::fail("Unknown option: " + flag);
            print_usage();
            return 1;
        }
    }

    if (i >= args.size()) {
        print_usage();
        return 1;
    }

    std::string cmd = args[i];
    std::vector<std::string> cmd_args(args.begin() + i + 1, args.end());
    if (!has_command(cmd)) {
        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    }
    return execute_command(cmd, cmd_args);
}
