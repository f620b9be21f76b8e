#include "libssh2_transport.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <chrono>
#include <mutex>

static std::once_flag g_libssh2_init;

// ── Libssh2Connection ──────────────────────────────────────

Libssh2Connection::Libssh2Connection(LIBSSH2_SESSION* session, int sock, std::string address)
    : session_(session), sock_(sock), address_(std::move(address)) {
}

Libssh2Connection::~Libssh2Connection() {
    close();
}

void Libssh2Connection::close() {
    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

// ── Libssh2Transport ───────────────────────────────────────

Libssh2Transport::Libssh2Transport(int port) : port_(port) {
    std::call_once(g_libssh2_init, []() { libssh2_init(0); });
}

Result<std::shared_ptr<NodeConnection>> Libssh2Transport::connect(
        const std::string& address, const SshCredentials& credentials,
        std::chrono::seconds timeout) {
    using R = Result<std::shared_ptr<NodeConnection>>;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::string error;
    int sock = platform::connect_tcp(address, port_,
                                     static_cast<int>(timeout.count() * 1000), error);
    if (sock < 0) return R::Err(error);

    LIBSSH2_SESSION* session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session) {
        platform::close_socket(sock);
        return R::Err("Failed to create SSH session");
    }
    libssh2_session_set_blocking(session, 0);

    auto fail = [&](const std::string& msg) {
        libssh2_session_disconnect(session, msg.c_str());
        libssh2_session_free(session);
        platform::close_socket(sock);
        return R::Err(fmt::format("{}: {}", address, msg));
    };

    int ret;
    while ((ret = libssh2_session_handshake(session, sock)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) return fail("SSH handshake timed out");
        platform::sleep_ms(50);
    }
    if (ret != 0) return fail("SSH handshake failed");

    std::string pub = credentials.public_key.empty() ? "" : expand_path(credentials.public_key);
    std::string priv = expand_path(credentials.private_key);
    while ((ret = libssh2_userauth_publickey_fromfile(
                session, credentials.user.c_str(),
                pub.empty() ? nullptr : pub.c_str(),
                priv.c_str(), nullptr)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) return fail("Authentication timed out");
        platform::sleep_ms(50);
    }
    if (ret != 0) {
        return fail(fmt::format("Authentication failed for user {} with key {}",
                                credentials.user, priv));
    }

    libssh2_keepalive_config(session, 1, 30);

    log_debug("SSH connection to {}@{} established", credentials.user, address);
    return R::Ok(std::make_shared<Libssh2Connection>(session, sock, address));
}
