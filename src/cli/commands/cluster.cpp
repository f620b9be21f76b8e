#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/cancellation.hpp>
#include <core/errors.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

// Pull `--flag value` out of args. Returns "" if absent.
static std::string take_option(std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) return "";
    std::string value = *(it + 1);
    args.erase(it, it + 2);
    return value;
}

static bool take_flag(std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end()) return false;
    args.erase(it);
    return true;
}

static void print_frontend(const Cluster& cluster) {
    try {
        auto front = cluster.get_frontend_node();
        std::cout << theme::kv("frontend", front->name());
        std::cout << theme::kv("address", front->connection_ip().empty() ? "-" : front->connection_ip());
        std::cout << theme::step(fmt::format("Connect with: cumulus ssh {}", cluster.name()));
    } catch (const NodeNotFound& e) {
        std::cout << theme::fail(e.what());
    }
}

static int do_start(BaseCLI& cli, const std::vector<std::string>& argv) {
    std::vector<std::string> args = argv;
    std::string template_name = take_option(args, "--template");
    bool no_setup = take_flag(args, "--no-setup");
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: cumulus start <cluster> [--template T] [--no-setup]");
        return 1;
    }
    if (!cli.require_service()) return 1;

    const std::string& name = args[0];
    auto& service = *cli.service;
    auto cb = cli_status_callback();

    std::unique_ptr<Cluster> cluster;
    if (service.providers().store->exists(name)) {
        auto loaded = service.load_cluster(name);
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            return 1;
        }
        cluster = std::move(loaded.value);
        std::cout << theme::info(fmt::format("Resuming start of existing cluster {}", name));
    } else {
        if (template_name.empty()) template_name = name;
        auto created = service.create_cluster(name, template_name);
        if (created.is_err()) {
            std::cout << theme::fail(created.error);
            return 1;
        }
        cluster = std::move(created.value);
        cluster->checkpoint();
    }

    CancellationToken token;
    StartOptions opts = service.start_options_for(*cluster);
    opts.cancel = &token;
    opts.trap_sigint = true;

    auto report = cluster->start(opts, cb);

    for (const auto& n : report.failed_to_launch) std::cout << theme::fail(n + " could not be launched");
    for (const auto& n : report.not_alive) std::cout << theme::fail(n + " did not boot in time");
    for (const auto& n : report.unreachable) std::cout << theme::fail(n + " was not reachable over SSH");
    for (const auto& m : report.moves) {
        std::cout << theme::info(fmt::format("One `{}` node now serves as `{}`", m.from, m.to));
    }
    std::cout << theme::ok(fmt::format("Cluster {} is up with {} node(s)",
                                       name, cluster->get_all_nodes().size()));

    int rc = 0;
    if (!no_setup) {
        if (cluster->setup(cb)) {
            std::cout << theme::ok("Cluster configured");
        } else {
            std::cout << theme::fail(fmt::format(
                "Cluster not yet configured. Re-run `cumulus setup {}`", name));
            rc = 1;
        }
    }

    print_frontend(*cluster);
    return rc;
}

static int do_stop(BaseCLI& cli, const std::vector<std::string>& argv) {
    std::vector<std::string> args = argv;
    bool force = take_flag(args, "--force");
    if (args.size() != 1) {
        std::cout << theme::fail("Usage: cumulus stop <cluster> [--force]");
        return 1;
    }
    if (!cli.require_service()) return 1;

    auto loaded = cli.service->load_cluster(args[0]);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return 1;
    }

    switch (loaded.value->stop(force, cli_status_callback())) {
        case StopOutcome::DELETED:
            std::cout << theme::ok(fmt::format("Cluster {} stopped and deleted", args[0]));
            return 0;
        case StopOutcome::PARTIAL:
            std::cout << theme::fail("Some nodes could not be terminated. "
                                     "Fix the errors above and re-run stop, or use --force.");
            return 1;
        case StopOutcome::FORCE_DELETED:
            std::cout << theme::fail("Cluster deleted, but some instances may still be running.");
            return 1;
    }
    return 1;
}

static int do_list(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_service()) return 1;

    auto summaries = cli.service->list_clusters();
    if (summaries.empty()) {
        std::cout << theme::dim("  No clusters.") << "\n";
        return 0;
    }

    // Compute column widths from headers and data
    size_t w0 = 4, w1 = 8, w2 = 5;
    for (const auto& s : summaries) {
        w0 = std::max(w0, s.name.size());
        w1 = std::max(w1, s.template_name.size());
    }

    std::string rfmt = fmt::format("  {{:<{}}} {{:<{}}} {{:<{}}} {{}}\n", w0 + 2, w1 + 2, w2 + 2);

    std::cout << "\n";
    std::cout << theme::color::DIM
              << fmt::format(fmt::runtime(rfmt), "NAME", "TEMPLATE", "NODES", "FRONTEND")
              << theme::color::RESET;
    for (const auto& s : summaries) {
        std::cout << fmt::format(fmt::runtime(rfmt), s.name, s.template_name,
                                 s.node_count, s.frontend);
    }
    std::cout << "\n";
    return 0;
}

// Shared by the commands that act on one stored cluster
static std::unique_ptr<Cluster> load_one(BaseCLI& cli, const std::vector<std::string>& args,
                                         const char* usage) {
    if (args.size() != 1) {
        std::cout << theme::fail(std::string("Usage: ") + usage);
        return nullptr;
    }
    if (!cli.require_service()) return nullptr;

    auto loaded = cli.service->load_cluster(args[0]);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return nullptr;
    }
    return std::move(loaded.value);
}

static int do_list_nodes(BaseCLI& cli, const std::vector<std::string>& args) {
    auto cluster = load_one(cli, args, "cumulus list-nodes <cluster>");
    if (!cluster) return 1;

    std::cout << theme::section(fmt::format("Cluster {}", cluster->name()));
    std::cout << theme::kv("template", cluster->template_name().empty() ? "-" : cluster->template_name());
    for (const auto& [kind, group] : cluster->nodes()) {
        std::cout << theme::kv(kind, fmt::format("{} node(s)", group.size()));
    }
    std::cout << theme::divider();
    for (const auto& node : cluster->get_all_nodes()) {
        std::cout << node->pprint() << "\n";
    }
    return 0;
}

static int do_setup(BaseCLI& cli, const std::vector<std::string>& args) {
    auto cluster = load_one(cli, args, "cumulus setup <cluster>");
    if (!cluster) return 1;

    if (cluster->setup(cli_status_callback())) {
        std::cout << theme::ok(fmt::format("Cluster {} configured", cluster->name()));
        return 0;
    }
    std::cout << theme::fail(fmt::format("Cluster {} not yet configured", cluster->name()));
    return 1;
}

static int do_update(BaseCLI& cli, const std::vector<std::string>& args) {
    auto cluster = load_one(cli, args, "cumulus update <cluster>");
    if (!cluster) return 1;

    cluster->update(cli_status_callback());
    std::cout << theme::ok(fmt::format("Addresses of cluster {} refreshed", cluster->name()));
    print_frontend(*cluster);
    return 0;
}

void register_cluster_commands(BaseCLI& cli) {
    cli.add_command("start", do_start, "start <cluster> [--template T]",
                    "Create (or resume) and start a cluster, then set it up");
    cli.add_command("stop", do_stop, "stop <cluster> [--force]",
                    "Terminate all nodes and delete the cluster");
    cli.add_command("list", do_list, "list", "List stored clusters");
    cli.add_command("list-nodes", do_list_nodes, "list-nodes <cluster>",
                    "Show the nodes of a cluster");
    cli.add_command("setup", do_setup, "setup <cluster>", "(Re)configure a running cluster");
    cli.add_command("update", do_update, "update <cluster>", "Refresh node addresses");
}
