#include "group_rebalancer.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

Result<RebalancePlan> plan_rebalance(const std::map<std::string, int>& counts,
                                     const std::map<std::string, int>& minimums) {
    std::map<std::string, int> have = counts;
    std::map<std::string, int> need;
    for (const auto& [kind, n] : counts) need[kind] = n;
    for (const auto& [kind, n] : minimums) {
        need[kind] = n;
        have.emplace(kind, 0);
    }

    int total_have = 0;
    int total_need = 0;
    for (const auto& [kind, n] : have) total_have += n;
    for (const auto& [kind, n] : need) total_need += n;

    if (total_have < total_need) {
        return Result<RebalancePlan>::Err(fmt::format(
            "the cluster has {} node(s) but the configuration requires at least {}",
            total_have, total_need));
    }

    RebalancePlan plan;

    std::vector<std::string> unsatisfied;
    for (const auto& [kind, n] : need) {
        if (have[kind] < n) unsatisfied.push_back(kind);
    }

    std::vector<std::string> still_unsatisfied;
    for (const auto& target : unsatisfied) {
        int missing = need[target] - have[target];

        for (auto& [donor, donor_count] : have) {
            if (donor == target) continue;
            int spare = donor_count - need[donor];
            while (spare > 0 && missing > 0) {
                plan.moves.push_back({donor, target});
                donor_count--;
                have[target]++;
                spare--;
                missing--;
            }
            if (missing == 0) break;
        }

        if (missing > 0) still_unsatisfied.push_back(target);
    }

    if (!still_unsatisfied.empty()) {
        std::vector<std::string> detail;
        for (const auto& kind : still_unsatisfied) {
            detail.push_back(fmt::format("`{}` has {} of {}", kind, have[kind], need[kind]));
        }
        return Result<RebalancePlan>::Err(fmt::format(
            "cannot redistribute nodes to satisfy the group minimums ({})",
            fmt::join(detail, ", ")));
    }

    plan.final_counts = have;
    return Result<RebalancePlan>::Ok(plan);
}
