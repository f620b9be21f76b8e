#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>

namespace fs = std::filesystem;

// Persisted state of one node.
struct NodeRecord {
    std::string name;
    std::string kind;
    NodeSpec spec;
    std::optional<std::string> instance_id;
    std::vector<std::string> ips;
    std::optional<std::string> preferred_ip;
};

// Full snapshot of a cluster: the unit every store reads and writes.
struct ClusterSnapshot {
    std::string name;
    std::string template_name;
    std::string ssh_to;
    int startup_timeout_secs = STARTUP_TIMEOUT_SECS;
    LoginConfig login;
    std::map<std::string, std::vector<NodeRecord>> groups;
};

// Persistence for clusters between invocations. Writes are always whole
// snapshots, so saving the same state twice is a no-op in effect.
class ClusterStore {
public:
    virtual ~ClusterStore() = default;

    virtual Result<void> save_or_update(const ClusterSnapshot& snapshot) = 0;
    virtual Result<void> remove(const std::string& cluster_name) = 0;
    virtual Result<ClusterSnapshot> load(const std::string& cluster_name) = 0;
    virtual std::vector<std::string> list() = 0;
    virtual bool exists(const std::string& cluster_name) = 0;
};

// In-memory store (tests, throwaway clusters).
class MemClusterStore : public ClusterStore {
public:
    Result<void> save_or_update(const ClusterSnapshot& snapshot) override;
    Result<void> remove(const std::string& cluster_name) override;
    Result<ClusterSnapshot> load(const std::string& cluster_name) override;
    std::vector<std::string> list() override;
    bool exists(const std::string& cluster_name) override;

    int save_count() const { return save_count_; }
    int remove_count() const { return remove_count_; }

private:
    std::mutex mutex_;
    std::map<std::string, ClusterSnapshot> clusters_;
    int save_count_ = 0;
    int remove_count_ = 0;
};

// One YAML document per cluster: <storage_dir>/<name>.yaml
class YamlClusterStore : public ClusterStore {
public:
    explicit YamlClusterStore(const fs::path& storage_dir);

    Result<void> save_or_update(const ClusterSnapshot& snapshot) override;
    Result<void> remove(const std::string& cluster_name) override;
    Result<ClusterSnapshot> load(const std::string& cluster_name) override;
    std::vector<std::string> list() override;
    bool exists(const std::string& cluster_name) override;

    fs::path path_for(const std::string& cluster_name) const;
    const fs::path& storage_dir() const { return storage_dir_; }

private:
    fs::path storage_dir_;
};
