#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_cluster_commands(BaseCLI& cli);
void register_shell_commands(BaseCLI& cli);

class CumulusCLI : public BaseCLI {
public:
    CumulusCLI();

    // Parse global flags, then dispatch. Returns the process exit status.
    int run(int argc, char** argv);

    void print_usage() const;
    void print_version() const;

private:
    void register_all_commands();
};
