#pragma once

// Socket utilities for the SSH transport.

#include <poll.h>
#include <string>

using socket_t = int;
#define NIMBUS_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host and start a non-blocking TCP connect, waiting up to
// timeout_secs for it to complete. Returns the socket, or
// NIMBUS_INVALID_SOCKET with err filled in.
socket_t connect_tcp(const std::string& host, int port, int timeout_secs, std::string& err);

} // namespace platform
