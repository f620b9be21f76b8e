#include "provisioning_pool.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

int ProvisioningReport::succeeded() const {
    return static_cast<int>(std::count(launched.begin(), launched.end(), true));
}

int ProvisioningReport::failed() const {
    return static_cast<int>(launched.size()) - succeeded();
}

ProvisioningPool::ProvisioningPool(const CancellationToken& token) : token_(token) {}

bool ProvisioningPool::launch_one(Node& node) {
    log_debug("Provisioning: working on node {}", node.name());

    if (node.is_alive()) {
        log_info("Not starting node {} which is already up and running", node.name());
        return true;
    }

    if (token_.is_cancelled()) {
        log_info("Not starting node {}: start was interrupted", node.name());
        return false;
    }

    auto r = node.launch();
    if (r.is_err()) return false;

    log_info("Node {} has been started", node.name());
    return true;
}

ProvisioningReport ProvisioningPool::launch_all(const std::vector<NodePtr>& nodes,
                                                StatusCallback cb) {
    ProvisioningReport report;
    report.launched.assign(nodes.size(), false);
    if (nodes.empty()) return report;

    std::mutex mtx;
    std::condition_variable done_cv;
    size_t finished = 0;
    // vector<bool> packs bits, so workers write to their own slot here
    std::vector<char> results(nodes.size(), 0);

    log_debug("Created pool of {} threads", nodes.size());

    std::vector<std::thread> workers;
    workers.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); i++) {
        workers.emplace_back([&, i]() {
            bool ok = false;
            try {
                ok = launch_one(*nodes[i]);
            } catch (const std::exception& e) {
                log_error("Could not start node `{}`: {}", nodes[i]->name(), e.what());
            }
            std::lock_guard<std::mutex> lock(mtx);
            results[i] = ok ? 1 : 0;
            finished++;
            done_cv.notify_all();
        });
    }

    // Wait for the batch, waking up regularly to notice an interrupt
    {
        std::unique_lock<std::mutex> lock(mtx);
        bool reported_interrupt = false;
        while (finished < nodes.size()) {
            done_cv.wait_for(lock, std::chrono::milliseconds(INTERRUPT_CHECK_MS));
            if (token_.is_cancelled() && !reported_interrupt) {
                reported_interrupt = true;
                log_error("User interruption: waiting for in-flight launches before saving");
                if (cb) cb("Interrupted: waiting for in-flight launches to finish...");
            }
        }
    }

    for (auto& t : workers) t.join();

    for (size_t i = 0; i < nodes.size(); i++) report.launched[i] = results[i] != 0;
    report.interrupted = token_.is_cancelled();

    if (cb) {
        cb(fmt::format("{} of {} node(s) launched", report.succeeded(), nodes.size()));
    }
    return report;
}
