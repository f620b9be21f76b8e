#pragma once

#include <map>
#include <string>
#include <vector>
#include <core/types.hpp>

// Move the most recently added node of `from` to the end of `to`.
struct NodeMove {
    std::string from;
    std::string to;

    bool operator==(const NodeMove& o) const { return from == o.from && to == o.to; }
};

struct RebalancePlan {
    std::vector<NodeMove> moves;                // in application order
    std::map<std::string, int> final_counts;    // per kind, after the moves
};

// Decide how to redistribute already provisioned nodes so that every kind
// reaches its minimum.
//
// Kinds missing from `minimums` default to their current count; kinds
// missing from `counts` have zero nodes. Greedy, single pass: each short
// kind (in name order) takes nodes from the kinds with spare capacity (in
// name order) one at a time. Returns Err naming the violated constraint
// when the total is too small or a kind cannot be filled.
Result<RebalancePlan> plan_rebalance(const std::map<std::string, int>& counts,
                                     const std::map<std::string, int>& minimums);
