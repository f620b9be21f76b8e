#pragma once

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <core/config.hpp>
#include <cluster/cluster.hpp>

// Pure data struct for UI consumption.
struct ClusterSummary {
    std::string name;
    std::string template_name;
    int node_count = 0;
    std::string frontend;     // "name (ip)" or "-"
};

// Headless service facade: owns the backends built from the config and
// hands out Cluster objects wired to them. Usable by any frontend.
class CumulusService {
public:
    // Build the command cloud, Ansible setup, libssh2 transport and YAML
    // store from the config.
    explicit CumulusService(Config config);

    // Use the given backends instead (tests, alternative frontends).
    CumulusService(Config config, ClusterProviders providers);

    const Config& config() const { return config_; }
    const ClusterProviders& providers() const { return providers_; }

    // New cluster from a template (nodes added, nothing launched). Fails if
    // a cluster with this name is already stored or the template is unknown.
    Result<std::unique_ptr<Cluster>> create_cluster(const std::string& name,
                                                    const std::string& template_name);

    // Cluster restored from the store.
    Result<std::unique_ptr<Cluster>> load_cluster(const std::string& name);

    // Start options for a cluster: the template's per-kind minimums, or
    // nothing if the template is no longer configured.
    StartOptions start_options_for(const Cluster& cluster) const;

    std::vector<ClusterSummary> list_clusters();

private:
    Config config_;
    ClusterProviders providers_;
};
