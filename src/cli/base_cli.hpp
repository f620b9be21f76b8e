#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <filesystem>
#include <core/config.hpp>
#include <managers/cumulus_service.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    // Returns the process exit status
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& usage,
                    const std::string& help);

    // Load the config (creating the default one on first use) and build
    // the service. Prints the failure and returns false on error.
    bool require_service();

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;
    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    // Public state
    std::filesystem::path config_path;   // empty = ~/.cumulus/config.yaml
    bool verbose = false;
    std::unique_ptr<CumulusService> service;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
};

// Progress callback printing dim status lines
StatusCallback cli_status_callback();
