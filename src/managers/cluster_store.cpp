#include "cluster_store.hpp"
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>

// ── MemClusterStore ──────────────────────────────────────────

Result<void> MemClusterStore::save_or_update(const ClusterSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    clusters_[snapshot.name] = snapshot;
    save_count_++;
    return Result<void>::Ok();
}

Result<void> MemClusterStore::remove(const std::string& cluster_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    clusters_.erase(cluster_name);
    remove_count_++;
    return Result<void>::Ok();
}

Result<ClusterSnapshot> MemClusterStore::load(const std::string& cluster_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clusters_.find(cluster_name);
    if (it == clusters_.end()) {
        return Result<ClusterSnapshot>::Err("Cluster `" + cluster_name + "` not found");
    }
    return Result<ClusterSnapshot>::Ok(it->second);
}

std::vector<std::string> MemClusterStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : clusters_) names.push_back(name);
    return names;
}

bool MemClusterStore::exists(const std::string& cluster_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return clusters_.count(cluster_name) > 0;
}

// ── YamlClusterStore ─────────────────────────────────────────

static void emit_optional(YAML::Emitter& out, const char* key,
                          const std::optional<std::string>& value) {
    out << YAML::Key << key << YAML::Value;
    if (value) {
        out << *value;
    } else {
        out << YAML::Null;
    }
}

static std::optional<std::string> read_optional(const YAML::Node& n) {
    if (!n || n.IsNull()) return std::nullopt;
    auto s = n.as<std::string>("");
    if (s.empty()) return std::nullopt;
    return s;
}

YamlClusterStore::YamlClusterStore(const fs::path& storage_dir)
    : storage_dir_(storage_dir) {
}

fs::path YamlClusterStore::path_for(const std::string& cluster_name) const {
    return storage_dir_ / (cluster_name + ".yaml");
}

bool YamlClusterStore::exists(const std::string& cluster_name) {
    return fs::exists(path_for(cluster_name));
}

std::vector<std::string> YamlClusterStore::list() {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(storage_dir_, ec)) return names;

    for (const auto& entry : fs::directory_iterator(storage_dir_, ec)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != ".yaml") continue;
        names.push_back(entry.path().stem().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

Result<ClusterSnapshot> YamlClusterStore::load(const std::string& cluster_name) {
    fs::path path = path_for(cluster_name);
    if (!fs::exists(path)) {
        return Result<ClusterSnapshot>::Err("Cluster `" + cluster_name + "` not found in " +
                                            storage_dir_.string());
    }

    ClusterSnapshot snap;
    try {
        YAML::Node root = YAML::LoadFile(path.string());

        snap.name = root["name"].as<std::string>(cluster_name);
        snap.template_name = root["template"].as<std::string>("");
        snap.ssh_to = root["ssh_to"].as<std::string>("");
        snap.startup_timeout_secs = root["startup_timeout"].as<int>(STARTUP_TIMEOUT_SECS);

        if (root["login"] && root["login"].IsMap()) {
            const auto& l = root["login"];
            snap.login.image_user = l["image_user"].as<std::string>("");
            snap.login.user_key_name = l["user_key_name"].as<std::string>("");
            snap.login.user_key_public = l["user_key_public"].as<std::string>("");
            snap.login.user_key_private = l["user_key_private"].as<std::string>("");
        }

        if (root["groups"] && root["groups"].IsMap()) {
            for (const auto& g : root["groups"]) {
                std::string kind = g.first.as<std::string>();
                auto& records = snap.groups[kind];
                if (!g.second.IsSequence()) continue;

                for (const auto& n : g.second) {
                    NodeRecord r;
                    r.name = n["name"].as<std::string>("");
                    r.kind = kind;
                    r.spec.image_id = n["image_id"].as<std::string>("");
                    r.spec.image_user = n["image_user"].as<std::string>("");
                    r.spec.flavor = n["flavor"].as<std::string>("");
                    r.spec.security_group = n["security_group"].as<std::string>("");
                    r.spec.image_userdata = n["image_userdata"].as<std::string>("");
                    r.instance_id = read_optional(n["instance_id"]);
                    r.preferred_ip = read_optional(n["preferred_ip"]);
                    if (n["ips"] && n["ips"].IsSequence()) {
                        for (const auto& ip : n["ips"]) {
                            r.ips.push_back(ip.as<std::string>());
                        }
                    }
                    records.push_back(r);
                }
            }
        }
    } catch (const std::exception& e) {
        return Result<ClusterSnapshot>::Err(fmt::format("Corrupted cluster record {}: {}",
                                                        path.string(), e.what()));
    }

    return Result<ClusterSnapshot>::Ok(snap);
}

Result<void> YamlClusterStore::save_or_update(const ClusterSnapshot& snap) {
    std::error_code ec;
    fs::create_directories(storage_dir_, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create {}: {}",
                                             storage_dir_.string(), ec.message()));
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << snap.name;
    out << YAML::Key << "template" << YAML::Value << snap.template_name;
    out << YAML::Key << "ssh_to" << YAML::Value << snap.ssh_to;
    out << YAML::Key << "startup_timeout" << YAML::Value << snap.startup_timeout_secs;

    out << YAML::Key << "login" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "image_user" << YAML::Value << snap.login.image_user;
    out << YAML::Key << "user_key_name" << YAML::Value << snap.login.user_key_name;
    out << YAML::Key << "user_key_public" << YAML::Value << snap.login.user_key_public;
    out << YAML::Key << "user_key_private" << YAML::Value << snap.login.user_key_private;
    out << YAML::EndMap;

    out << YAML::Key << "groups" << YAML::Value << YAML::BeginMap;
    for (const auto& [kind, records] : snap.groups) {
        out << YAML::Key << kind << YAML::Value << YAML::BeginSeq;
        for (const auto& r : records) {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << r.name;
            out << YAML::Key << "image_id" << YAML::Value << r.spec.image_id;
            out << YAML::Key << "image_user" << YAML::Value << r.spec.image_user;
            out << YAML::Key << "flavor" << YAML::Value << r.spec.flavor;
            out << YAML::Key << "security_group" << YAML::Value << r.spec.security_group;
            out << YAML::Key << "image_userdata" << YAML::Value << r.spec.image_userdata;
            emit_optional(out, "instance_id", r.instance_id);
            emit_optional(out, "preferred_ip", r.preferred_ip);
            out << YAML::Key << "ips" << YAML::Value << YAML::Flow << r.ips;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;

    // Write beside the target and rename so a crash never leaves half a record
    fs::path path = path_for(snap.name);
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream fout(tmp.string());
        if (!fout) {
            return Result<void>::Err("Cannot write " + tmp.string());
        }
        fout << out.c_str() << "\n";
        if (!fout) {
            return Result<void>::Err("Short write to " + tmp.string());
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot replace {}: {}", path.string(), ec.message()));
    }

    log_debug("Saved cluster {} to {}", snap.name, path.string());
    return Result<void>::Ok();
}

Result<void> YamlClusterStore::remove(const std::string& cluster_name) {
    std::error_code ec;
    fs::remove(path_for(cluster_name), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot remove record for {}: {}",
                                             cluster_name, ec.message()));
    }
    log_debug("Removed cluster record {}", cluster_name);
    return Result<void>::Ok();
}
