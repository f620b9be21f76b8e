#pragma once

#include <string>
#include <map>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.cumulus/config.yaml
    static Result<Config> load_global();

    // Load an explicit config file
    static Result<Config> load(const fs::path& path);

    // Parse config text (used by load() and tests)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const CloudConfig& cloud() const { return cloud_; }
    const LoginConfig& login() const { return login_; }
    const SetupConfig& setup() const { return setup_; }
    const std::map<std::string, ClusterTemplate>& templates() const { return templates_; }
    const fs::path& storage_dir() const { return storage_dir_; }
    const std::string& log_level() const { return log_level_; }

    // nullptr if no template has this name
    const ClusterTemplate* find_template(const std::string& name) const;

    Config() = default;

private:
    CloudConfig cloud_;
    LoginConfig login_;
    SetupConfig setup_;
    std::map<std::string, ClusterTemplate> templates_;
    fs::path storage_dir_;
    std::string log_level_ = "info";
};

// Per-kind minimum counts of a template (`min`, falling back to `count`)
std::map<std::string, int> template_min_nodes(const ClusterTemplate& tmpl);

// Helper to check if the config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
