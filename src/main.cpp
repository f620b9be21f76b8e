#include <iostream>
#include <string>
#include "cli/cumulus_cli.hpp"
#include "cli/theme.hpp"
#include <core/errors.hpp>

int main(int argc, char** argv) {
    try {
        CumulusCLI cli;
        return cli.run(argc, argv);
    } catch (const ClusterInterrupted& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 130;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
