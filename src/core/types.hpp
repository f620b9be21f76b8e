#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// External command / remote command execution result
struct CommandResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// SSH key material shared by every node of a cluster
struct LoginConfig {
    std::string image_user;
    std::string user_key_name;
    std::string user_key_public;     // path to public key file
    std::string user_key_private;    // path to private key file
};

// Per-node launch description (what the cloud is asked to create)
struct NodeSpec {
    std::string image_id;
    std::string image_user;
    std::string flavor;
    std::string security_group;
    std::string image_userdata;      // boot script, may be empty
};

// Everything the cloud provider needs to launch one instance
struct LaunchParams {
    std::string node_name;
    std::string key_name;
    std::string public_key;
    std::string private_key;
    NodeSpec spec;
};

// Credentials presented by the transport when connecting to a node
struct SshCredentials {
    std::string user;
    std::string public_key;
    std::string private_key;
};

// `cloud:` section. Each command is a shell template, see CommandCloudProvider.
struct CloudConfig {
    std::string provider = "command";
    std::string launch;
    std::string terminate;
    std::string status;
    std::string addresses;
    std::string running_state = "running";
    int command_timeout = 120;
};

// `setup:` section
struct SetupConfig {
    std::string provider = "ansible";
    std::string playbook;
    std::string extra_args;
};

// One node kind of a cluster template
struct NodeKindConfig {
    int count = 0;
    std::optional<int> min;          // defaults to count
    NodeSpec spec;
};

// `clusters.<name>:` section
struct ClusterTemplate {
    std::string name;
    std::string ssh_to;
    int startup_timeout = 600;
    std::map<std::string, NodeKindConfig> nodes;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
