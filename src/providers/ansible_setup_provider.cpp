#include "ansible_setup_provider.hpp"
#include <cluster/cluster.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

AnsibleSetupProvider::AnsibleSetupProvider(SetupConfig config, fs::path storage_dir)
    : config_(std::move(config)), storage_dir_(std::move(storage_dir)) {}

fs::path AnsibleSetupProvider::inventory_path(const std::string& cluster_name) const {
    return storage_dir_ / (cluster_name + ".inventory");
}

std::string AnsibleSetupProvider::build_inventory(const Cluster& cluster) {
    std::string out;
    for (const auto& [kind, group] : cluster.nodes()) {
        if (group.empty()) continue;
        out += fmt::format("[{}]\n", kind);
        for (const auto& node : group) {
            std::string ip = node->connection_ip();
            if (ip.empty() && !node->ips().empty()) ip = node->ips().front();
            if (ip.empty()) {
                log_warn("Node `{}` has no known address, leaving it out of the inventory",
                         node->name());
                continue;
            }
            out += fmt::format("{} ansible_host={} ansible_user={} ansible_ssh_private_key_file={}\n",
                               node->name(), ip, node->launch_params().spec.image_user,
                               node->launch_params().private_key);
        }
        out += "\n";
    }
    return out;
}

Result<bool> AnsibleSetupProvider::apply_to(const Cluster& cluster) {
    if (config_.playbook.empty()) {
        return Result<bool>::Err("no `playbook` configured in the `setup` section");
    }
    if (!fs::exists(config_.playbook)) {
        return Result<bool>::Err("playbook not found: " + config_.playbook);
    }

    std::error_code ec;
    fs::create_directories(storage_dir_, ec);
    fs::path inventory = inventory_path(cluster.name());
    {
        std::ofstream out(inventory);
        if (!out) {
            return Result<bool>::Err("cannot write inventory " + inventory.string());
        }
        out << build_inventory(cluster);
    }
    log_debug("Wrote Ansible inventory {}", inventory.string());

    std::vector<std::string> args = {"-i", inventory.string(), config_.playbook};
    std::istringstream extra(config_.extra_args);
    std::string arg;
    while (extra >> arg) args.push_back(arg);

    log_info("Running ansible-playbook on cluster `{}`", cluster.name());
    auto proc = platform::spawn("ansible-playbook", args);
    if (!proc.valid()) {
        return Result<bool>::Err("could not start ansible-playbook");
    }

    int rc = proc.wait();
    if (rc == 127) {
        return Result<bool>::Err("ansible-playbook not found on PATH");
    }
    if (rc != 0) {
        log_warn("ansible-playbook exited with status {}", rc);
        return Result<bool>::Ok(false);
    }
    return Result<bool>::Ok(true);
}

void AnsibleSetupProvider::cleanup(const Cluster& cluster) {
    fs::path inventory = inventory_path(cluster.name());
    std::error_code ec;
    if (fs::remove(inventory, ec)) {
        log_debug("Removed Ansible inventory {}", inventory.string());
    } else if (ec) {
        log_warn("Could not remove inventory {}: {}", inventory.string(), ec.message());
    }
}
