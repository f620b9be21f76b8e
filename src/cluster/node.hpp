#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <managers/cluster_store.hpp>
#include <providers/cloud_provider.hpp>
#include <ssh/transport.hpp>

// One cloud instance slot of a cluster.
//
// A Node owns its launch parameters and connection state; the cloud
// provider and transport are shared with the rest of the cluster.
// During provisioning each node is touched by exactly one worker thread,
// so Node itself does no locking.
class Node {
public:
    Node(std::string name, std::string kind, LaunchParams params,
         std::shared_ptr<CloudProvider> cloud,
         std::shared_ptr<SshTransport> transport);

    // Rebuild a node from persisted state.
    static std::shared_ptr<Node> from_record(const NodeRecord& record,
                                             const LoginConfig& login,
                                             std::shared_ptr<CloudProvider> cloud,
                                             std::shared_ptr<SshTransport> transport);

    const std::string& name() const { return name_; }
    const std::string& kind() const { return kind_; }
    const LaunchParams& launch_params() const { return params_; }
    const std::optional<std::string>& instance_id() const { return instance_id_; }
    const std::vector<std::string>& ips() const { return ips_; }
    const std::optional<std::string>& preferred_ip() const { return preferred_ip_; }

    // Address used for connections: the preferred IP, or "" if none yet.
    std::string connection_ip() const { return preferred_ip_.value_or(""); }

    // Request a backing instance. Does not wait for boot.
    Result<void> launch();

    // Destroy the backing instance, if any, and forget its id. On an
    // explicit provider error the id is kept and the error returned.
    Result<void> terminate();

    // Run-state check. Query errors count as "not yet". A running node
    // gets its addresses refreshed before this returns true.
    bool is_alive();

    // Replace the candidate addresses with the cloud's current view.
    Result<std::vector<std::string>> refresh_ips();

    // Try the preferred address first, then the rest in order. Returns
    // nullptr when no address accepts the connection.
    std::shared_ptr<NodeConnection> connect(
        std::chrono::seconds timeout = std::chrono::seconds(SSH_CONNECT_TIMEOUT_SECS));

    NodeRecord record() const;

    // One-line summary for logs.
    std::string describe() const;
    // Multi-line summary for `list-nodes`.
    std::string pprint() const;

private:
    friend class Cluster;   // group moves retag the kind

    std::string name_;
    std::string kind_;
    LaunchParams params_;
    std::shared_ptr<CloudProvider> cloud_;
    std::shared_ptr<SshTransport> transport_;

    std::optional<std::string> instance_id_;
    std::vector<std::string> ips_;
    std::optional<std::string> preferred_ip_;
};

using NodePtr = std::shared_ptr<Node>;
