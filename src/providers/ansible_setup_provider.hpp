#pragma once

#include <filesystem>
#include <string>
#include <core/types.hpp>
#include "setup_provider.hpp"

namespace fs = std::filesystem;

// Configures a cluster by running an Ansible playbook over it.
//
// The inventory is written to <storage_dir>/<cluster>.inventory with one
// [kind] section per node group, then `ansible-playbook -i <inventory>
// <playbook> <extra_args>` runs with the terminal's stdout/stderr.
class AnsibleSetupProvider : public SetupProvider {
public:
    AnsibleSetupProvider(SetupConfig config, fs::path storage_dir);

    Result<bool> apply_to(const Cluster& cluster) override;

    // Removes the inventory file.
    void cleanup(const Cluster& cluster) override;

    fs::path inventory_path(const std::string& cluster_name) const;

    // Inventory text. Nodes with no known address are left out.
    static std::string build_inventory(const Cluster& cluster);

private:
    SetupConfig config_;
    fs::path storage_dir_;
};
