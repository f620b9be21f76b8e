#include "cluster.hpp"
#include "provisioning_pool.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/interrupt.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <stdexcept>

Cluster::Cluster(std::string name, LoginConfig login, ClusterProviders providers)
    : name_(std::move(name)), login_(std::move(login)), providers_(std::move(providers)) {
    clock_ = providers_.clock ? providers_.clock : std::make_shared<SteadyClock>();
}

std::unique_ptr<Cluster> Cluster::restore(const ClusterSnapshot& snapshot,
                                          ClusterProviders providers) {
    auto cluster = std::make_unique<Cluster>(snapshot.name, snapshot.login, std::move(providers));
    cluster->template_name_ = snapshot.template_name;
    cluster->ssh_to_ = snapshot.ssh_to;
    cluster->startup_timeout_ = std::chrono::seconds(snapshot.startup_timeout_secs);

    for (const auto& [kind, records] : snapshot.groups) {
        cluster->nodes_[kind];
        for (const auto& rec : records) {
            NodeRecord fixed = rec;
            fixed.kind = kind;
            cluster->insert_node(Node::from_record(fixed, snapshot.login,
                                                   cluster->providers_.cloud,
                                                   cluster->providers_.transport));
        }
    }
    return cluster;
}

// ── Membership ─────────────────────────────────────────────

void Cluster::insert_node(NodePtr node) {
    nodes_[node->kind()].push_back(std::move(node));
}

void Cluster::add_group(const std::string& kind) {
    static const std::regex kind_re(KIND_PATTERN);
    if (!std::regex_match(kind, kind_re)) {
        throw std::invalid_argument(fmt::format(
            "Invalid name `{}` for node group. A valid node group name can only "
            "consist of letters, digits or the hyphen character (`-`)", kind));
    }
    nodes_[kind];
}

NodePtr Cluster::add_node(const std::string& kind, const NodeSpec& spec,
                          const std::string& name) {
    add_group(kind);

    std::string node_name = name;
    if (node_name.empty()) {
        // One past the highest ordinal in use, in any group (moves keep names)
        int highest = 0;
        for (const auto& node : get_all_nodes()) {
            const std::string& n = node->name();
            if (n.size() <= kind.size() || n.compare(0, kind.size(), kind) != 0) continue;
            std::string digits = n.substr(kind.size());
            if (!std::all_of(digits.begin(), digits.end(),
                             [](unsigned char ch) { return std::isdigit(ch); })) continue;
            if (digits.size() > 9) continue;
            highest = std::max(highest, std::stoi(digits));
        }
        node_name = fmt::format(NODE_NAME_FORMAT, kind, highest + 1);
    }

    for (const auto& node : get_all_nodes()) {
        if (node->name() == node_name) {
            throw std::invalid_argument(fmt::format(
                "Cluster `{}` already has a node named `{}`", name_, node_name));
        }
    }

    LaunchParams params;
    params.key_name = login_.user_key_name;
    params.public_key = login_.user_key_public;
    params.private_key = login_.user_key_private;
    params.spec = spec;
    if (params.spec.image_user.empty()) params.spec.image_user = login_.image_user;

    auto node = std::make_shared<Node>(node_name, kind, std::move(params),
                                       providers_.cloud, providers_.transport);
    insert_node(node);
    log_debug("Added node {} to cluster {}", node_name, name_);
    return node;
}

void Cluster::add_nodes(const std::string& kind, int num, const NodeSpec& spec) {
    add_group(kind);
    for (int i = 0; i < num; i++) add_node(kind, spec);
}

void Cluster::remove_node(const Node& node) {
    auto it = nodes_.find(node.kind());
    if (it == nodes_.end()) {
        log_error("Unable to remove node `{}`: invalid node kind `{}`", node.name(), node.kind());
        return;
    }
    auto& group = it->second;
    group.erase(std::remove_if(group.begin(), group.end(),
                               [&](const NodePtr& n) { return n.get() == &node; }),
                group.end());
}

std::vector<NodePtr> Cluster::get_all_nodes() const {
    std::vector<NodePtr> all;
    for (const auto& [kind, group] : nodes_) {
        all.insert(all.end(), group.begin(), group.end());
    }
    return all;
}

// ── Start ──────────────────────────────────────────────────

void Cluster::evict(const std::vector<NodePtr>& nodes, const std::string& reason,
                    std::vector<std::string>& evicted, StatusCallback cb) {
    for (const auto& node : nodes) {
        log_error("Node `{}` {}. Stopping it and removing it from cluster `{}`",
                  node->name(), reason, name_);
        if (cb) cb(fmt::format("Removing node {} ({})", node->name(), reason));
        log_debug("Evicting {}", node->describe());

        auto r = node->terminate();
        if (r.is_err()) {
            log_error("Could not terminate node `{}` (instance {}): {}. The instance "
                      "may still be running and must be removed by hand",
                      node->name(), node->instance_id().value_or("?"), r.error);
        }
        evicted.push_back(node->name());
        remove_node(*node);
    }
}

StartReport Cluster::start(const StartOptions& opts, StatusCallback cb) {
    StartReport report;

    CancellationToken local_token;
    CancellationToken& token = opts.cancel ? *opts.cancel : local_token;

    auto nodes = get_all_nodes();
    log_info("Starting cluster `{}` with {} node(s)", name_, nodes.size());
    if (cb) cb(fmt::format("Starting cluster {} with {} node(s)...", name_, nodes.size()));

    ProvisioningReport launched;
    {
        std::optional<platform::InterruptGuard> guard;
        if (opts.trap_sigint) guard.emplace(token);
        ProvisioningPool pool(token);
        launched = pool.launch_all(nodes, cb);
    }

    if (launched.interrupted) {
        checkpoint();
        throw ClusterInterrupted(fmt::format(
            "Start of cluster `{}` interrupted. Nodes already launched have been "
            "recorded; run `stop {}` to release them", name_, name_));
    }

    std::vector<NodePtr> running;
    std::vector<NodePtr> failed;
    for (size_t i = 0; i < nodes.size(); i++) {
        if (launched.launched[i]) {
            running.push_back(nodes[i]);
        } else {
            failed.push_back(nodes[i]);
        }
    }
    evict(failed, "could not be launched", report.failed_to_launch, cb);
    checkpoint();

    ReachabilityPoller poller(*clock_);

    // Wait until the cloud reports every node as running
    if (cb) cb("Waiting for nodes to boot...");
    auto not_alive = poller.poll(running,
                                 [](Node& node) { return node.is_alive(); },
                                 std::chrono::seconds(LIVENESS_POLL_SECS),
                                 startup_timeout_, cb);
    evict(not_alive, "did not start in time", report.not_alive, cb);
    checkpoint();

    // Wait until every node accepts an SSH connection
    if (cb) cb("Waiting for SSH on all nodes...");
    auto unreachable = poller.poll(get_all_nodes(),
                                   [](Node& node) {
                                       auto conn = node.connect();
                                       if (!conn) return false;
                                       log_debug("Connection to node `{}` successful, using IP {}",
                                                 node.name(), node.connection_ip());
                                       conn->close();
                                       return true;
                                   },
                                   std::chrono::seconds(CONNECT_POLL_SECS),
                                   startup_timeout_, cb);
    evict(unreachable, "could not be reached over SSH", report.unreachable, cb);
    checkpoint();

    report.moves = check_cluster_size(opts.min_nodes);
    if (!report.moves.empty()) checkpoint();

    log_info("Cluster `{}` started with {} node(s)", name_, get_all_nodes().size());
    return report;
}

std::vector<NodeMove> Cluster::check_cluster_size(const std::map<std::string, int>& min_nodes) {
    std::map<std::string, int> counts;
    for (const auto& [kind, group] : nodes_) counts[kind] = static_cast<int>(group.size());

    auto plan = plan_rebalance(counts, min_nodes);
    if (plan.is_err()) {
        throw ClusterError(fmt::format(
            "Cluster `{}`: {}. The running nodes are kept but will not be set up; "
            "stop the cluster or add nodes and run `setup`", name_, plan.error));
    }

    for (const auto& move : plan.value.moves) {
        auto& from = nodes_[move.from];
        NodePtr node = from.back();
        from.pop_back();

        log_info("Moving node `{}` from group `{}` to group `{}`",
                 node->name(), move.from, move.to);
        node->kind_ = move.to;
        nodes_[move.to].push_back(std::move(node));
    }
    return plan.value.moves;
}

// ── Setup / stop / update ──────────────────────────────────

bool Cluster::setup(StatusCallback cb) {
    if (cb) cb(fmt::format("Configuring cluster {}...", name_));

    bool ok = false;
    try {
        auto r = providers_.setup->apply_to(*this);
        if (r.is_err()) {
            log_error("Setup of cluster `{}` failed: {}", name_, r.error);
        } else {
            ok = r.value;
        }
    } catch (const std::exception& e) {
        log_error("Setup of cluster `{}` failed: {}", name_, e.what());
    }

    if (!ok) {
        log_warn("Cluster `{}` not yet configured. Please re-run `cumulus setup {}` "
                 "and/or check your configuration", name_, name_);
    }
    return ok;
}

StopOutcome Cluster::stop(bool force, StatusCallback cb) {
    int failures = 0;
    for (const auto& node : get_all_nodes()) {
        if (cb) cb(fmt::format("Stopping node {}...", node->name()));
        auto r = node->terminate();
        if (r.is_ok()) {
            log_debug("Removing node `{}` from cluster `{}`", node->name(), name_);
            remove_node(*node);
            continue;
        }

        failures++;
        log_error("Could not stop node `{}` (instance {}): {}",
                  node->name(), node->instance_id().value_or("?"), r.error);
        if (force) remove_node(*node);
    }

    auto drop_cluster = [&]() {
        try {
            providers_.setup->cleanup(*this);
        } catch (const std::exception& e) {
            log_error("Cleanup of cluster `{}` failed: {}", name_, e.what());
        }
        auto r = providers_.store->remove(name_);
        if (r.is_err()) log_error("Could not delete record of cluster `{}`: {}", name_, r.error);
    };

    if (failures == 0) {
        drop_cluster();
        log_info("Cluster `{}` stopped and deleted", name_);
        return StopOutcome::DELETED;
    }

    if (!force) {
        log_warn("Not all cluster nodes have been terminated. Fix the errors above "
                 "and re-run `cumulus stop {}`", name_);
        checkpoint();
        return StopOutcome::PARTIAL;
    }

    log_warn("Not all cluster nodes have been terminated, but `--force` was given: "
             "deleting cluster `{}` anyway. Some instances may still be running",
             name_);
    drop_cluster();
    return StopOutcome::FORCE_DELETED;
}

void Cluster::update(StatusCallback cb) {
    for (const auto& node : get_all_nodes()) {
        if (cb) cb(fmt::format("Refreshing addresses of {}...", node->name()));
        auto r = node->refresh_ips();
        if (r.is_err()) {
            log_warn("Could not refresh addresses of node `{}`: {}", node->name(), r.error);
        }
    }
    checkpoint();
}

// ── Lookup / persistence ───────────────────────────────────

NodePtr Cluster::get_frontend_node() const {
    if (!ssh_to_.empty()) {
        auto it = nodes_.find(ssh_to_);
        if (it == nodes_.end()) {
            throw NodeNotFound(fmt::format(
                "Invalid `ssh_to` value `{}`: cluster `{}` has no such node group",
                ssh_to_, name_));
        }
        if (!it->second.empty()) return it->second.front();
        log_warn("Preferred node group `{}` of cluster `{}` is empty, "
                 "falling back to the default frontend", ssh_to_, name_);
    }

    // Groups are kept in name order
    for (const auto& [kind, group] : nodes_) {
        if (!group.empty()) return group.front();
    }
    throw NodeNotFound(fmt::format("Cluster `{}` has no nodes", name_));
}

ClusterSnapshot Cluster::snapshot() const {
    ClusterSnapshot snap;
    snap.name = name_;
    snap.template_name = template_name_;
    snap.ssh_to = ssh_to_;
    snap.startup_timeout_secs = static_cast<int>(startup_timeout_.count());
    snap.login = login_;
    for (const auto& [kind, group] : nodes_) {
        auto& records = snap.groups[kind];
        for (const auto& node : group) records.push_back(node->record());
    }
    return snap;
}

void Cluster::checkpoint() {
    auto r = providers_.store->save_or_update(snapshot());
    if (r.is_err()) {
        log_error("Could not save state of cluster `{}`: {}", name_, r.error);
    }
}
