#include "reachability_poller.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <thread>

Clock::time_point SteadyClock::now() {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep_for(duration d) {
    std::this_thread::sleep_for(d);
}

ReachabilityPoller::ReachabilityPoller(Clock& clock) : clock_(clock) {}

std::vector<NodePtr> ReachabilityPoller::poll(const std::vector<NodePtr>& nodes,
                                              const NodePredicate& predicate,
                                              Clock::duration interval,
                                              Clock::duration timeout,
                                              StatusCallback cb) {
    rounds_ = 0;
    std::vector<NodePtr> pending = nodes;
    const auto deadline = clock_.now() + timeout;

    while (true) {
        rounds_++;
        pending.erase(std::remove_if(pending.begin(), pending.end(),
                                     [&](const NodePtr& n) { return predicate(*n); }),
                      pending.end());

        if (pending.empty()) return pending;

        auto now = clock_.now();
        if (now >= deadline) {
            log_debug("Polling deadline reached with {} node(s) pending", pending.size());
            return pending;
        }

        if (cb) {
            auto left = std::chrono::duration_cast<std::chrono::seconds>(deadline - now);
            cb(fmt::format("{} node(s) pending, {}s left", pending.size(), left.count()));
        }

        clock_.sleep_for(std::min<Clock::duration>(interval, deadline - now));
    }
}
