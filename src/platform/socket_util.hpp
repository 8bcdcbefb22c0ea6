#pragma once

// TCP helpers for the libssh2 transport (POSIX sockets).

#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;
#define FLEETCMD_INVALID_SOCKET (-1)

namespace platform {

void set_nonblocking(socket_t sock);

// poll() one socket. Returns revents, or 0 on timeout.
int poll_socket(socket_t sock, short events, int timeout_ms);

void close_socket(socket_t sock);

// Resolve host (IPv4, IPv6 or name) and open a non-blocking TCP connection,
// trying each resolved address until one connects within timeout_ms.
// Errors read "dial tcp host:port: reason".
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

} // namespace platform
