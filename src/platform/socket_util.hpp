#pragma once

// Socket helpers for the SSH transport.

#include <poll.h>
#include <string>

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(int sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(int sock, short events, int timeout_ms);

// Close a socket.
void close_socket(int sock);

// Open a non-blocking TCP connection to host:port, waiting at most
// timeout_ms for the connect to complete. host may be an IPv4/IPv6 literal
// or a resolvable name. Returns the socket, or -1 with error filled in.
int connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error);

} // namespace platform
