#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <core/types.hpp>

// An authenticated connection to one node.
class NodeConnection {
public:
    virtual ~NodeConnection() = default;

    virtual void close() = 0;

    // Address this connection was opened to.
    virtual const std::string& address() const = 0;
};

// Opens connections to nodes. Network unreachability and authentication
// rejection are both reported as Err; callers treat them the same way.
class SshTransport {
public:
    virtual ~SshTransport() = default;

    virtual Result<std::shared_ptr<NodeConnection>> connect(const std::string& address,
                                                            const SshCredentials& credentials,
                                                            std::chrono::seconds timeout) = 0;
};
