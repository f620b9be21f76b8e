#pragma once

#include <memory>
#include <string>
#include "transport.hpp"

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// One authenticated libssh2 session over its own socket.
class Libssh2Connection : public NodeConnection {
public:
    Libssh2Connection(LIBSSH2_SESSION* session, int sock, std::string address);
    ~Libssh2Connection() override;

    Libssh2Connection(const Libssh2Connection&) = delete;
    Libssh2Connection& operator=(const Libssh2Connection&) = delete;

    void close() override;
    const std::string& address() const override { return address_; }

private:
    LIBSSH2_SESSION* session_;
    int sock_;
    std::string address_;
};

// Public-key SSH to port 22. Host keys are not verified: nodes are fresh
// instances whose keys cannot be known in advance.
class Libssh2Transport : public SshTransport {
public:
    explicit Libssh2Transport(int port = 22);

    Result<std::shared_ptr<NodeConnection>> connect(const std::string& address,
                                                    const SshCredentials& credentials,
                                                    std::chrono::seconds timeout) override;

private:
    int port_;
};
