#pragma once

#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host (IPv4 or IPv6) and open a non-blocking TCP connection,
// waiting up to timeout_ms for it to complete. Enables TCP keepalive.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
