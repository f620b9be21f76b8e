#pragma once

#include <chrono>
#include <functional>
#include <vector>
#include <core/types.hpp>
#include "node.hpp"

// Time source for the polling loops. Tests substitute a fake that
// advances on sleep_for() instead of blocking.
class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() = 0;
    virtual void sleep_for(duration d) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() override;
    void sleep_for(duration d) override;
};

using NodePredicate = std::function<bool(Node&)>;

// Deadline-bound loop over a set of nodes.
//
// Each round evaluates the predicate on the nodes that have not yet
// satisfied it. Satisfied nodes are dropped and never evaluated again.
// Between rounds the poller sleeps `interval`, but never past the
// deadline. Returns the nodes still pending when the deadline passed
// (empty on success); what happens to them is the caller's decision.
class ReachabilityPoller {
public:
    explicit ReachabilityPoller(Clock& clock);

    std::vector<NodePtr> poll(const std::vector<NodePtr>& nodes,
                              const NodePredicate& predicate,
                              Clock::duration interval,
                              Clock::duration timeout,
                              StatusCallback cb = nullptr);

    // Rounds evaluated by the last poll() call.
    int rounds() const { return rounds_; }

private:
    Clock& clock_;
    int rounds_ = 0;
};
