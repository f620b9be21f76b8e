#include "socket_util.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(int sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(int sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(int sock) {
    close(sock);
}

int connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        error = "Failed to resolve host " + host + ": " + gai_strerror(gai);
        return -1;
    }

    int sock = -1;
    for (auto* ai = res; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            error = "Failed to create socket: " + std::string(strerror(errno));
            continue;
        }
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            error = "Failed to connect to " + host + ": " + strerror(errno);
            close_socket(sock);
            sock = -1;
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            int revents = poll_socket(sock, POLLOUT, timeout_ms);
            if (revents == 0) {
                error = "Connection timed out: " + host;
                close_socket(sock);
                sock = -1;
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                error = "Connection failed to " + host + ": " + strerror(sock_err);
                close_socket(sock);
                sock = -1;
                continue;
            }
        }
        break;
    }

    freeaddrinfo(res);
    return sock;
}

} // namespace platform
