#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "cloud_provider.hpp"

// Drives any cloud through its command-line client.
//
// Every operation expands one shell template from the `cloud:` config
// section and runs it with /bin/sh -c. Templates use fmt named fields:
// {instance_id} {image_id} {flavor} {key_name} {public_key}
// {security_group} {image_user} {node_name} {userdata_file}.
// Each call forks its own process, so concurrent launches are safe.
class CommandCloudProvider : public CloudProvider {
public:
    explicit CommandCloudProvider(CloudConfig config);

    // First non-empty stdout line is the instance id.
    Result<std::string> launch_instance(const LaunchParams& params) override;

    // "not found" in the output of a failed command counts as terminated.
    Result<void> terminate_instance(const std::string& instance_id) override;

    // Trimmed stdout compared (case-insensitively) to running_state.
    Result<bool> is_running(const std::string& instance_id) override;

    // IPv4 literals found in stdout, in order, without duplicates.
    Result<std::vector<std::string>> list_addresses(const std::string& instance_id) override;

    const CloudConfig& config() const { return config_; }

private:
    CloudConfig config_;

    CommandResult run(const std::string& what, const std::string& command);
};

// Extract IPv4 literals from free-form CLI output, first occurrence order.
std::vector<std::string> extract_ipv4_addresses(const std::string& text);
