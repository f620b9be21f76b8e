#include "node.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

Node::Node(std::string name, std::string kind, LaunchParams params,
           std::shared_ptr<CloudProvider> cloud,
           std::shared_ptr<SshTransport> transport)
    : name_(std::move(name)), kind_(std::move(kind)), params_(std::move(params)),
      cloud_(std::move(cloud)), transport_(std::move(transport)) {
    params_.node_name = name_;
}

std::shared_ptr<Node> Node::from_record(const NodeRecord& record,
                                        const LoginConfig& login,
                                        std::shared_ptr<CloudProvider> cloud,
                                        std::shared_ptr<SshTransport> transport) {
    LaunchParams params;
    params.key_name = login.user_key_name;
    params.public_key = login.user_key_public;
    params.private_key = login.user_key_private;
    params.spec = record.spec;

    auto node = std::make_shared<Node>(record.name, record.kind, params,
                                       std::move(cloud), std::move(transport));
    node->instance_id_ = record.instance_id;
    node->ips_ = record.ips;
    node->preferred_ip_ = record.preferred_ip;
    return node;
}

Result<void> Node::launch() {
    log_info("Starting node {}", name_);

    Result<std::string> r = Result<std::string>::Err("no result");
    try {
        r = cloud_->launch_instance(params_);
    } catch (const std::exception& e) {
        r = Result<std::string>::Err(e.what());
    }

    if (r.is_err()) {
        log_error("Could not start node `{}`: {}", name_, r.error);
        return Result<void>::Err(r.error);
    }

    instance_id_ = r.value;
    log_debug("Node {} has instance id `{}`", name_, r.value);
    return Result<void>::Ok();
}

Result<void> Node::terminate() {
    if (!instance_id_) {
        log_debug("Node {} has no instance to terminate", name_);
        return Result<void>::Ok();
    }

    log_info("Shutting down instance `{}` of node {}", *instance_id_, name_);

    Result<void> r = Result<void>::Ok();
    try {
        r = cloud_->terminate_instance(*instance_id_);
    } catch (const std::exception& e) {
        r = Result<void>::Err(e.what());
    }

    if (r.is_err()) {
        log_error("Could not stop instance `{}` of node {}: {}", *instance_id_, name_, r.error);
        return r;
    }

    // A terminated instance may still report "running" for a while; once
    // the id is gone is_alive() never asks the cloud about it again.
    instance_id_.reset();
    return Result<void>::Ok();
}

bool Node::is_alive() {
    if (!instance_id_) return false;

    log_debug("Getting information for instance {}", *instance_id_);

    Result<bool> r = Result<bool>::Ok(false);
    try {
        r = cloud_->is_running(*instance_id_);
    } catch (const std::exception& e) {
        r = Result<bool>::Err(e.what());
    }

    if (r.is_err()) {
        log_debug("Ignoring error while looking for instance {}: {}", *instance_id_, r.error);
        return false;
    }

    if (!r.value) {
        log_debug("Node `{}` (instance `{}`) still building...", name_, *instance_id_);
        return false;
    }

    log_debug("Node `{}` (instance `{}`) is up and running", name_, *instance_id_);
    auto ips = refresh_ips();
    if (ips.is_err()) {
        log_warn("Node {} is running but its addresses are not available yet: {}",
                 name_, ips.error);
    }
    return true;
}

Result<std::vector<std::string>> Node::refresh_ips() {
    if (!instance_id_) {
        return Result<std::vector<std::string>>::Err(
            fmt::format("node {} has no instance", name_));
    }

    Result<std::vector<std::string>> r = Result<std::vector<std::string>>::Ok({});
    try {
        r = cloud_->list_addresses(*instance_id_);
    } catch (const std::exception& e) {
        r = Result<std::vector<std::string>>::Err(e.what());
    }
    if (r.is_err()) return r;

    ips_ = r.value;
    return r;
}

std::shared_ptr<NodeConnection> Node::connect(std::chrono::seconds timeout) {
    std::vector<std::string> order;
    if (preferred_ip_) order.push_back(*preferred_ip_);
    for (const auto& ip : ips_) {
        if (preferred_ip_ && ip == *preferred_ip_) continue;
        order.push_back(ip);
    }

    SshCredentials creds{params_.spec.image_user, params_.public_key, params_.private_key};

    for (const auto& ip : order) {
        log_debug("Trying to connect to host {} ({})", name_, ip);

        Result<std::shared_ptr<NodeConnection>> r =
            Result<std::shared_ptr<NodeConnection>>::Err("no result");
        try {
            r = transport_->connect(ip, creds, timeout);
        } catch (const std::exception& e) {
            r = Result<std::shared_ptr<NodeConnection>>::Err(e.what());
        }

        if (r.is_err() || !r.value) {
            log_debug("Host {} ({}) not reachable: {}", name_, ip, r.error);
            continue;
        }

        log_debug("Connection to {} succeeded", ip);
        if (!preferred_ip_ || *preferred_ip_ != ip) {
            log_debug("Setting preferred IP of {} to {}", name_, ip);
            preferred_ip_ = ip;
        }
        return r.value;
    }

    return nullptr;
}

NodeRecord Node::record() const {
    NodeRecord r;
    r.name = name_;
    r.kind = kind_;
    r.spec = params_.spec;
    r.instance_id = instance_id_;
    r.ips = ips_;
    r.preferred_ip = preferred_ip_;
    return r;
}

std::string Node::describe() const {
    return fmt::format("name=`{}`, id=`{}`, ips={}, connection_ip=`{}`",
                       name_, instance_id_.value_or(""),
                       fmt::join(ips_, ", "), connection_ip());
}

std::string Node::pprint() const {
    return fmt::format("{}\n"
                       "  connection IP:   {}\n"
                       "  IPs:             {}\n"
                       "  instance id:     {}\n"
                       "  instance flavor: {}\n",
                       name_, connection_ip(), fmt::join(ips_, ", "),
                       instance_id_.value_or("-"), params_.spec.flavor);
}
