#pragma once

// Socket utilities for unix-domain connections.

#include <poll.h>
#include <cstddef>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define CTLSSH_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Set a socket back to blocking mode.
void set_blocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Connect to a unix-domain stream socket at path within timeout_ms.
// Returns a blocking socket.
Result<socket_t> dial_unix(const std::string& path, int timeout_ms);

// Half-close: no more writes from us, reads stay open.
void shutdown_write(socket_t sock);

// Write all of data, retrying short writes and EINTR. False on error.
bool write_all(int fd, const void* data, size_t len);

// Read exactly len bytes. False on EOF or error.
bool read_exact(int fd, void* data, size_t len);

// Pass fd to the peer of sock with SCM_RIGHTS.
bool send_fd(socket_t sock, int fd);

} // namespace platform
