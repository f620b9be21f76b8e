#pragma once

#include <stdexcept>
#include <string>

// Cluster sizing cannot be satisfied. Instances are left running.
class ClusterError : public std::runtime_error {
public:
    explicit ClusterError(const std::string& msg) : std::runtime_error(msg) {}
};

// No node matches a lookup (frontend selection, name lookup).
class NodeNotFound : public std::runtime_error {
public:
    explicit NodeNotFound(const std::string& msg) : std::runtime_error(msg) {}
};

// Provisioning was interrupted by the user. The cluster has already been
// checkpointed when this is thrown.
class ClusterInterrupted : public std::runtime_error {
public:
    explicit ClusterInterrupted(const std::string& msg) : std::runtime_error(msg) {}
};
