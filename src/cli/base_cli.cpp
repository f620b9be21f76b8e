#include "base_cli.hpp"
#include "theme.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() = default;

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& usage,
                         const std::string& help) {
    commands_[name] = {handler, usage, help};
}

bool BaseCLI::require_service() {
    if (service) return true;

    Result<Config> config_result = Result<Config>::Err("");
    if (config_path.empty()) {
        auto created = create_default_global_config();
        if (created.is_err()) {
            std::cout << theme::fail(created.error);
            return false;
        }
        config_result = Config::load_global();
    } else {
        config_result = Config::load(config_path);
    }

    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        return false;
    }

    const Config& config = config_result.value;
    set_log_level(verbose ? LogLevel::DEBUG : parse_log_level(config.log_level()));
    set_log_echo(true);

    try {
        service = std::make_unique<CumulusService>(config);
    } catch (const std::exception& e) {
        std::cout << theme::fail(e.what());
        return false;
    }
    return true;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'cumulus --help' for available commands.");
        return 1;
    }

    try {
        return it->second.handler(*this, args);
    } catch (const ClusterInterrupted& e) {
        std::cout << "\n" << theme::fail(e.what());
        return 130;
    } catch (const std::exception& e) {
        log_error("{}: {}", command, e.what());
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Lifecycle", {"start", "setup", "update", "stop"}},
        {"Inspect",   {"list", "list-nodes"}},
        {"Access",    {"ssh"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::BLUE
                      << fmt::format("    {:<30}", it->second.usage)
                      << theme::color::RESET
                      << theme::color::DIM
                      << it->second.help
                      << theme::color::RESET << "\n";
        }
    }
    std::cout << "\n";
}

StatusCallback cli_status_callback() {
    return [](const std::string& msg) {
        std::cout << theme::log(msg) << std::flush;
    };
}
