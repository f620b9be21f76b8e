#pragma once

#include <core/types.hpp>

class Cluster;

// Post-provisioning configuration of a running cluster.
class SetupProvider {
public:
    virtual ~SetupProvider() = default;

    // Install/configure software on every node. Ok(false) means the run
    // completed but reported failure.
    virtual Result<bool> apply_to(const Cluster& cluster) = 0;

    // Called once the cluster has been fully torn down.
    virtual void cleanup(const Cluster& cluster) = 0;
};
