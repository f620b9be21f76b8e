#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Access to the cloud that backs each node with an instance.
//
// Implementations must be safe to call from several threads at once:
// launch_instance() runs concurrently for every node of a cluster.
class CloudProvider {
public:
    virtual ~CloudProvider() = default;

    // Request a new instance. Returns its id as soon as the cloud hands
    // one back; does not wait for boot.
    virtual Result<std::string> launch_instance(const LaunchParams& params) = 0;

    // Destroy an instance. An instance the cloud no longer knows about is
    // reported as Ok.
    virtual Result<void> terminate_instance(const std::string& instance_id) = 0;

    // Run-state query.
    virtual Result<bool> is_running(const std::string& instance_id) = 0;

    // Addresses assigned to the instance, preferred first. May be empty
    // while public address assignment lags boot.
    virtual Result<std::vector<std::string>> list_addresses(const std::string& instance_id) = 0;
};
