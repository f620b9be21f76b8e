#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::cumulus_home();
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    // Default config content
    const char* default_config = R"(# cumulus configuration
# Command templates are run with /bin/sh -c. Available placeholders:
#   {instance_id} {image_id} {flavor} {key_name} {public_key}
#   {security_group} {image_user} {node_name} {userdata_file}

cloud:
  provider: command
  launch: "mycloud server create --image {image_id} --flavor {flavor} --key {key_name} --name {node_name} --print-id"
  terminate: "mycloud server delete {instance_id}"
  status: "mycloud server show {instance_id} --field status"
  addresses: "mycloud server show {instance_id} --field addresses"
  running_state: "running"
  command_timeout: 120

login:
  image_user: "ubuntu"
  user_key_name: "cumulus"
  user_key_public: "~/.ssh/id_rsa.pub"
  user_key_private: "~/.ssh/id_rsa"

setup:
  provider: ansible
  playbook: "~/.cumulus/playbooks/site.yml"
  extra_args: ""

clusters:
  slurm:
    image_id: "ubuntu-22.04"
    flavor: "m1.small"
    security_group: "default"
    ssh_to: "frontend"
    startup_timeout: 600
    nodes:
      frontend:
        count: 1
      compute:
        count: 2
        min: 1

# storage_dir: "~/.cumulus/storage"
log_level: "info"
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static CloudConfig parse_cloud_config(const YAML::Node& node) {
    CloudConfig cloud;
    cloud.provider = node["provider"].as<std::string>("command");
    cloud.launch = node["launch"].as<std::string>("");
    cloud.terminate = node["terminate"].as<std::string>("");
    cloud.status = node["status"].as<std::string>("");
    cloud.addresses = node["addresses"].as<std::string>("");
    cloud.running_state = node["running_state"].as<std::string>("running");
    cloud.command_timeout = node["command_timeout"].as<int>(CLOUD_CMD_TIMEOUT_SECS);
    return cloud;
}

static LoginConfig parse_login_config(const YAML::Node& node) {
    LoginConfig login;
    login.image_user = node["image_user"].as<std::string>("");
    login.user_key_name = node["user_key_name"].as<std::string>("");
    login.user_key_public = expand_path(node["user_key_public"].as<std::string>(""));
    login.user_key_private = expand_path(node["user_key_private"].as<std::string>(""));
    return login;
}

static SetupConfig parse_setup_config(const YAML::Node& node) {
    SetupConfig setup;
    setup.provider = node["provider"].as<std::string>("ansible");
    setup.playbook = expand_path(node["playbook"].as<std::string>(""));
    setup.extra_args = node["extra_args"].as<std::string>("");
    return setup;
}

// Read the node-spec keys present in `node` on top of `base`
static NodeSpec overlay_node_spec(const YAML::Node& node, NodeSpec base) {
    if (node["image_id"]) base.image_id = node["image_id"].as<std::string>();
    if (node["image_user"]) base.image_user = node["image_user"].as<std::string>();
    if (node["flavor"]) base.flavor = node["flavor"].as<std::string>();
    if (node["security_group"]) base.security_group = node["security_group"].as<std::string>();
    if (node["image_userdata"]) base.image_userdata = node["image_userdata"].as<std::string>();
    return base;
}

static ClusterTemplate parse_cluster_template(const std::string& name, const YAML::Node& node) {
    ClusterTemplate tmpl;
    tmpl.name = name;
    tmpl.ssh_to = node["ssh_to"].as<std::string>("");
    tmpl.startup_timeout = node["startup_timeout"].as<int>(STARTUP_TIMEOUT_SECS);
    if (tmpl.startup_timeout <= 0) {
        throw std::runtime_error(fmt::format(
            "cluster `{}`: startup_timeout must be positive", name));
    }

    NodeSpec defaults = overlay_node_spec(node, NodeSpec{});

    if (node["nodes"] && node["nodes"].IsMap()) {
        for (const auto& kv : node["nodes"]) {
            std::string kind = kv.first.as<std::string>();
            const auto& knode = kv.second;

            NodeKindConfig kc;
            kc.count = knode["count"].as<int>(0);
            if (knode["min"]) kc.min = knode["min"].as<int>();
            kc.spec = overlay_node_spec(knode, defaults);

            if (kc.count < 0) {
                throw std::runtime_error(fmt::format(
                    "cluster `{}`: node kind `{}` has a negative count", name, kind));
            }
            if (kc.min && (*kc.min < 0 || *kc.min > kc.count)) {
                throw std::runtime_error(fmt::format(
                    "cluster `{}`: node kind `{}` has min {} outside 0..{}",
                    name, kind, *kc.min, kc.count));
            }
            tmpl.nodes[kind] = kc;
        }
    }
    return tmpl;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        config.cloud_ = parse_cloud_config(root["cloud"] ? root["cloud"] : YAML::Node());
        config.login_ = parse_login_config(root["login"] ? root["login"] : YAML::Node());
        config.setup_ = parse_setup_config(root["setup"] ? root["setup"] : YAML::Node());

        if (root["clusters"] && root["clusters"].IsMap()) {
            for (const auto& kv : root["clusters"]) {
                std::string name = kv.first.as<std::string>();
                config.templates_[name] = parse_cluster_template(name, kv.second);
            }
        }

        std::string storage = root["storage_dir"].as<std::string>("");
        config.storage_dir_ = storage.empty()
            ? platform::cumulus_home() / STORAGE_SUBDIR
            : fs::path(expand_path(storage));
        config.log_level_ = root["log_level"].as<std::string>("info");

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config at " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse(text);
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("Global config not found at " + get_global_config_path().string());
    }
    return load(get_global_config_path());
}

const ClusterTemplate* Config::find_template(const std::string& name) const {
    auto it = templates_.find(name);
    return it == templates_.end() ? nullptr : &it->second;
}

std::map<std::string, int> template_min_nodes(const ClusterTemplate& tmpl) {
    std::map<std::string, int> mins;
    for (const auto& [kind, kc] : tmpl.nodes) {
        mins[kind] = kc.min.value_or(kc.count);
    }
    return mins;
}
