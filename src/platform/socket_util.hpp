#pragma once

// Cross-platform socket utilities.

#include <string>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define FANOUT_INVALID_SOCKET INVALID_SOCKET
#else
#  include <poll.h>
   using socket_t = int;
#  define FANOUT_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Pending error on a socket (SO_ERROR), 0 if none.
int socket_error(socket_t sock);

// Shut down both directions so any thread blocked on the socket wakes up.
// Safe to call from a thread other than the one using the socket.
void shutdown_socket(socket_t sock);

// Close a socket.
void close_socket(socket_t sock);

// Text for the last socket error code.
std::string socket_error_string(int err);

} // namespace platform
