#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <platform/process.hpp>
#include <iostream>
#include <fmt/format.h>

// Hand the terminal over to the system ssh client on the frontend node.
static int do_ssh(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: cumulus ssh <cluster> [-- ssh args...]");
        return 1;
    }
    if (!cli.require_service()) return 1;

    auto loaded = cli.service->load_cluster(args[0]);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return 1;
    }

    NodePtr frontend = loaded.value->get_frontend_node();
    std::string ip = frontend->connection_ip();
    if (ip.empty() && !frontend->ips().empty()) ip = frontend->ips().front();
    if (ip.empty()) {
        std::cout << theme::fail(fmt::format(
            "Node {} has no known address. Try `cumulus update {}`", frontend->name(), args[0]));
        return 1;
    }

    const auto& params = frontend->launch_params();
    std::vector<std::string> ssh_args = {
        "-i", params.private_key,
        "-o", SSH_OPTS_NOCHECK,
        "-o", SSH_OPTS_NO_KNOWN_HOSTS,
        "-p", std::to_string(SSH_PORT),
        params.spec.image_user + "@" + ip,
    };
    size_t rest = 1;
    if (rest < args.size() && args[rest] == "--") rest++;
    for (; rest < args.size(); rest++) ssh_args.push_back(args[rest]);

    std::cout << theme::info(fmt::format("Connecting to {} ({})", frontend->name(), ip));
    auto proc = platform::spawn("ssh", ssh_args, true);
    if (!proc.valid()) {
        std::cout << theme::fail("Could not start ssh");
        return 1;
    }
    return proc.wait();
}

void register_shell_commands(BaseCLI& cli) {
    cli.add_command("ssh", do_ssh, "ssh <cluster> [-- args]", "Open a shell on the frontend node");
}
