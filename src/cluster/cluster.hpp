#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <core/cancellation.hpp>
#include <core/types.hpp>
#include <managers/cluster_store.hpp>
#include <providers/cloud_provider.hpp>
#include <providers/setup_provider.hpp>
#include <ssh/transport.hpp>
#include "node.hpp"
#include "group_rebalancer.hpp"
#include "reachability_poller.hpp"

// Collaborators a cluster talks to. clock may be left null (steady clock).
struct ClusterProviders {
    std::shared_ptr<CloudProvider> cloud;
    std::shared_ptr<SetupProvider> setup;
    std::shared_ptr<SshTransport> transport;
    std::shared_ptr<ClusterStore> store;
    std::shared_ptr<Clock> clock;
};

struct StartOptions {
    // Per-kind minimum node counts. Kinds not listed keep at least what
    // they currently have.
    std::map<std::string, int> min_nodes;

    // Checked while nodes are being launched. May be null.
    CancellationToken* cancel = nullptr;

    // Route SIGINT to `cancel` while nodes are being launched.
    bool trap_sigint = false;
};

// What start() did to the node population.
struct StartReport {
    std::vector<std::string> failed_to_launch;
    std::vector<std::string> not_alive;        // evicted after the liveness deadline
    std::vector<std::string> unreachable;      // evicted after the connectivity deadline
    std::vector<NodeMove> moves;               // applied by the size check
};

enum class StopOutcome {
    DELETED,          // every node terminated, record deleted
    PARTIAL,          // some nodes could not be terminated, record kept
    FORCE_DELETED,    // some nodes could not be terminated, record deleted anyway
};

// A named group of nodes, organized by kind.
//
// Typical workflow: create, add nodes, start(), setup(), and eventually
// stop(). Every phase of start() is checkpointed to the store before the
// next begins, so an interrupted run never loses track of an instance.
// Not thread-safe: commands on the same cluster must be serialized.
class Cluster {
public:
    using NodeGroups = std::map<std::string, std::vector<NodePtr>>;

    Cluster(std::string name, LoginConfig login, ClusterProviders providers);

    // Rebuild a cluster from a stored snapshot.
    static std::unique_ptr<Cluster> restore(const ClusterSnapshot& snapshot,
                                            ClusterProviders providers);

    const std::string& name() const { return name_; }
    const LoginConfig& login() const { return login_; }
    const NodeGroups& nodes() const { return nodes_; }

    const std::string& template_name() const { return template_name_; }
    void set_template_name(const std::string& t) { template_name_ = t; }

    // Kind whose first node is the frontend. Empty = pick by name.
    const std::string& ssh_to() const { return ssh_to_; }
    void set_ssh_to(const std::string& kind) { ssh_to_ = kind; }

    std::chrono::seconds startup_timeout() const { return startup_timeout_; }
    void set_startup_timeout(std::chrono::seconds t) { startup_timeout_ = t; }

    // Make sure a (possibly empty) group exists for `kind`. Throws
    // std::invalid_argument if kind is not [a-zA-Z0-9-]+.
    void add_group(const std::string& kind);

    // Add a node to `kind` (bookkeeping only, nothing is launched). The
    // name defaults to kind + 3-digit ordinal, one past the highest in use.
    NodePtr add_node(const std::string& kind, const NodeSpec& spec,
                     const std::string& name = "");
    // The group is created even when num is 0.
    void add_nodes(const std::string& kind, int num, const NodeSpec& spec);

    // Forget a node without stopping its instance.
    void remove_node(const Node& node);

    // All nodes, kinds in name order, creation order within a kind.
    std::vector<NodePtr> get_all_nodes() const;

    // Launch, wait for liveness, wait for SSH, then check group sizes.
    // Throws ClusterError if the surviving nodes cannot satisfy min_nodes
    // (instances are left running) and ClusterInterrupted if the launch
    // was cancelled (after checkpointing).
    StartReport start(const StartOptions& opts = {}, StatusCallback cb = nullptr);

    // Delegate configuration to the setup provider. Failures are reported
    // as a warning and false; the cluster stays up.
    bool setup(StatusCallback cb = nullptr);

    // Terminate every node. See StopOutcome.
    StopOutcome stop(bool force = false, StatusCallback cb = nullptr);

    // Refresh every node's addresses and persist.
    void update(StatusCallback cb = nullptr);

    // Throws NodeNotFound if ssh_to names an unknown kind or the cluster
    // has no nodes at all.
    NodePtr get_frontend_node() const;

    ClusterSnapshot snapshot() const;

    // Write the current state to the store. Failures are logged.
    void checkpoint();

private:
    std::string name_;
    LoginConfig login_;
    ClusterProviders providers_;
    std::shared_ptr<Clock> clock_;
    std::string template_name_;
    std::string ssh_to_;
    std::chrono::seconds startup_timeout_{STARTUP_TIMEOUT_SECS};
    NodeGroups nodes_;

    void insert_node(NodePtr node);
    void evict(const std::vector<NodePtr>& nodes, const std::string& reason,
               std::vector<std::string>& evicted, StatusCallback cb);
    std::vector<NodeMove> check_cluster_size(const std::map<std::string, int>& min_nodes);
};
