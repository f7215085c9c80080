#pragma once

// Cross-platform socket utilities.

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SLATE_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define SLATE_INVALID_SOCKET (-1)
#endif

#include <string>

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Switch a socket between non-blocking and blocking mode.
void set_nonblocking(socket_t sock);
void set_blocking(socket_t sock);

// True if the last connect() on a non-blocking socket is still in progress.
bool connect_pending();

// Text for the last socket error (errno or WSAGetLastError).
std::string last_socket_error();

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc. timeout_ms < 0 waits forever.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Enable TCP keepalive probes on a connected socket.
void enable_keepalive(socket_t sock, int idle_secs, int interval_secs, int probes);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
