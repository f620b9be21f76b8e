#include "cumulus_service.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <providers/ansible_setup_provider.hpp>
#include <providers/command_cloud_provider.hpp>
#include <ssh/libssh2_transport.hpp>
#include <fmt/format.h>
#include <stdexcept>

static ClusterProviders default_providers(const Config& config) {
    if (config.cloud().provider != "command") {
        throw std::runtime_error(fmt::format(
            "Unsupported cloud provider `{}` (supported: command)", config.cloud().provider));
    }
    if (config.setup().provider != "ansible") {
        throw std::runtime_error(fmt::format(
            "Unsupported setup provider `{}` (supported: ansible)", config.setup().provider));
    }

    ClusterProviders p;
    p.cloud = std::make_shared<CommandCloudProvider>(config.cloud());
    p.setup = std::make_shared<AnsibleSetupProvider>(config.setup(), config.storage_dir());
    p.transport = std::make_shared<Libssh2Transport>();
    p.store = std::make_shared<YamlClusterStore>(config.storage_dir());
    p.clock = std::make_shared<SteadyClock>();
    return p;
}

CumulusService::CumulusService(Config config)
    : config_(std::move(config)), providers_(default_providers(config_)) {}

CumulusService::CumulusService(Config config, ClusterProviders providers)
    : config_(std::move(config)), providers_(std::move(providers)) {}

Result<std::unique_ptr<Cluster>> CumulusService::create_cluster(const std::string& name,
                                                                const std::string& template_name) {
    using R = Result<std::unique_ptr<Cluster>>;

    if (providers_.store->exists(name)) {
        return R::Err(fmt::format("Cluster `{}` already exists", name));
    }
    const ClusterTemplate* tmpl = config_.find_template(template_name);
    if (!tmpl) {
        return R::Err(fmt::format("No cluster template named `{}` in the configuration",
                                  template_name));
    }

    auto cluster = std::make_unique<Cluster>(name, config_.login(), providers_);
    cluster->set_template_name(template_name);
    cluster->set_ssh_to(tmpl->ssh_to);
    cluster->set_startup_timeout(std::chrono::seconds(tmpl->startup_timeout));

    try {
        for (const auto& [kind, kc] : tmpl->nodes) {
            cluster->add_nodes(kind, kc.count, kc.spec);
        }
    } catch (const std::invalid_argument& e) {
        return R::Err(fmt::format("Template `{}`: {}", template_name, e.what()));
    }

    log_info("Created cluster `{}` from template `{}` with {} node(s)",
             name, template_name, cluster->get_all_nodes().size());
    return R::Ok(std::move(cluster));
}

Result<std::unique_ptr<Cluster>> CumulusService::load_cluster(const std::string& name) {
    using R = Result<std::unique_ptr<Cluster>>;
    auto snap = providers_.store->load(name);
    if (snap.is_err()) return R::Err(snap.error);
    return R::Ok(Cluster::restore(snap.value, providers_));
}

StartOptions CumulusService::start_options_for(const Cluster& cluster) const {
    StartOptions opts;
    const ClusterTemplate* tmpl = config_.find_template(cluster.template_name());
    if (tmpl) {
        opts.min_nodes = template_min_nodes(*tmpl);
    } else if (!cluster.template_name().empty()) {
        log_warn("Template `{}` of cluster `{}` is no longer configured; "
                 "keeping current group sizes as minimums",
                 cluster.template_name(), cluster.name());
    }
    return opts;
}

std::vector<ClusterSummary> CumulusService::list_clusters() {
    std::vector<ClusterSummary> out;
    for (const auto& name : providers_.store->list()) {
        auto snap = providers_.store->load(name);
        if (snap.is_err()) {
            log_warn("Skipping unreadable cluster record `{}`: {}", name, snap.error);
            continue;
        }

        ClusterSummary s;
        s.name = name;
        s.template_name = snap.value.template_name;
        for (const auto& [kind, records] : snap.value.groups) {
            s.node_count += static_cast<int>(records.size());
        }

        auto cluster = Cluster::restore(snap.value, providers_);
        try {
            auto front = cluster->get_frontend_node();
            std::string ip = front->connection_ip();
            s.frontend = ip.empty() ? front->name() : fmt::format("{} ({})", front->name(), ip);
        } catch (const NodeNotFound&) {
            s.frontend = "-";
        }
        out.push_back(s);
    }
    return out;
}
