#pragma once

// In-process stand-ins for the cloud, setup backend, SSH transport and
// clock, so cluster logic can be tested without a network or real time.

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <cluster/cluster.hpp>
#include <cluster/reachability_poller.hpp>
#include <providers/cloud_provider.hpp>
#include <providers/setup_provider.hpp>
#include <ssh/transport.hpp>

class FakeCloudProvider : public CloudProvider {
public:
    // Instance ids are "i-<node name>"
    static std::string id_for(const std::string& node_name) { return "i-" + node_name; }

    Result<std::string> launch_instance(const LaunchParams& params) override {
        if (on_launch) on_launch(params);
        std::lock_guard<std::mutex> lock(mutex);
        launched.push_back(params.node_name);
        if (fail_launch.count(params.node_name)) {
            return Result<std::string>::Err("quota exceeded");
        }
        return Result<std::string>::Ok(id_for(params.node_name));
    }

    Result<void> terminate_instance(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex);
        terminated.push_back(id);
        if (fail_terminate.count(id)) return Result<void>::Err("permission denied");
        return Result<void>::Ok();
    }

    Result<bool> is_running(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex);
        status_queries[id]++;
        if (status_error.count(id)) return Result<bool>::Err("API unavailable");
        if (never_running.count(id)) return Result<bool>::Ok(false);
        auto it = polls_until_running.find(id);
        if (it != polls_until_running.end() && status_queries[id] <= it->second) {
            return Result<bool>::Ok(false);
        }
        return Result<bool>::Ok(true);
    }

    Result<std::vector<std::string>> list_addresses(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = addresses.find(id);
        if (it != addresses.end()) return Result<std::vector<std::string>>::Ok(it->second);
        return Result<std::vector<std::string>>::Ok({"10.0.0.1"});
    }

    int launch_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<int>(launched.size());
    }

    int terminate_count(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<int>(std::count(terminated.begin(), terminated.end(), id));
    }

    std::mutex mutex;
    std::function<void(const LaunchParams&)> on_launch;   // called outside the lock
    std::vector<std::string> launched;
    std::vector<std::string> terminated;
    std::set<std::string> fail_launch;       // node names
    std::set<std::string> fail_terminate;    // instance ids
    std::set<std::string> status_error;      // instance ids
    std::set<std::string> never_running;     // instance ids
    std::map<std::string, int> polls_until_running;
    std::map<std::string, int> status_queries;
    std::map<std::string, std::vector<std::string>> addresses;
};

class FakeConnection : public NodeConnection {
public:
    explicit FakeConnection(std::string address) : address_(std::move(address)) {}

    void close() override { closed = true; }
    const std::string& address() const override { return address_; }

    bool closed = false;

private:
    std::string address_;
};

class FakeTransport : public SshTransport {
public:
    Result<std::shared_ptr<NodeConnection>> connect(const std::string& address,
                                                    const SshCredentials& credentials,
                                                    std::chrono::seconds) override {
        std::lock_guard<std::mutex> lock(mutex);
        attempts.push_back(address);
        last_credentials = credentials;
        if (reach_all ? unreachable.count(address) : !reachable.count(address)) {
            return Result<std::shared_ptr<NodeConnection>>::Err("Connection refused");
        }
        auto conn = std::make_shared<FakeConnection>(address);
        opened.push_back(conn);
        return Result<std::shared_ptr<NodeConnection>>::Ok(conn);
    }

    std::mutex mutex;
    bool reach_all = true;                  // false: only `reachable` accepts
    std::set<std::string> reachable;
    std::set<std::string> unreachable;
    std::vector<std::string> attempts;
    std::vector<std::shared_ptr<FakeConnection>> opened;
    SshCredentials last_credentials;
};

class FakeSetupProvider : public SetupProvider {
public:
    Result<bool> apply_to(const Cluster&) override {
        apply_count++;
        if (throw_on_apply) throw std::runtime_error("playbook crashed");
        return result;
    }

    void cleanup(const Cluster&) override { cleanup_count++; }

    Result<bool> result = Result<bool>::Ok(true);
    bool throw_on_apply = false;
    int apply_count = 0;
    int cleanup_count = 0;
};

// Virtual time: sleep_for() advances now() instantly.
class FakeClock : public Clock {
public:
    time_point now() override { return now_; }
    void sleep_for(duration d) override {
        sleeps.push_back(d);
        now_ += d;
    }

    duration elapsed() const { return now_ - time_point{}; }

    std::vector<duration> sleeps;

private:
    time_point now_{};
};
