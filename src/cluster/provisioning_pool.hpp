#pragma once

#include <vector>
#include <core/cancellation.hpp>
#include <core/types.hpp>
#include "node.hpp"

struct ProvisioningReport {
    std::vector<bool> launched;   // per node, same order as the input
    bool interrupted = false;

    int succeeded() const;
    int failed() const;
};

// Launches every node of a batch at once, one worker thread per node.
//
// A node that already reports alive is left alone and counts as launched,
// so re-running after an interrupted start does not double-launch.
// Failures stay per node. If the token is cancelled, workers that have not
// yet called the cloud skip their launch, workers already launching run to
// completion, and the report is marked interrupted. launch_all() returns
// only after every worker has been joined.
class ProvisioningPool {
public:
    explicit ProvisioningPool(const CancellationToken& token);

    ProvisioningReport launch_all(const std::vector<NodePtr>& nodes,
                                  StatusCallback cb = nullptr);

private:
    const CancellationToken& token_;

    bool launch_one(Node& node);
};
