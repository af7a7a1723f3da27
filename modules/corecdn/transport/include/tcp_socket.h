#ifndef LITECDN_TCP_SOCKET_H
#define LITECDN_TCP_SOCKET_H

#include <cstddef>
#include <string>

/**
 * Thin POSIX socket helpers shared by the broker server and client.
 * All return -1 / false on failure and describe the cause in *error.
 */

// Listening socket bound to INADDR_ANY. port 0 picks an ephemeral port; the
// chosen one is written to *bound_port.
int tcp_listen(int port, int backlog, int* bound_port, std::string* error);

// Blocking connect with a timeout (non-blocking connect + select).
int tcp_connect(const std::string& host, int port, int timeout_ms, std::string* error);

// Writes every byte, retrying on EINTR. Never raises SIGPIPE.
bool tcp_send_all(int sock, const char* data, size_t len, std::string* error);

// Waits up to timeout_ms for sock to become readable. 1 = readable, 0 = timeout, -1 = error.
int tcp_wait_readable(int sock, int timeout_ms);

void tcp_close(int sock);

#endif // LITECDN_TCP_SOCKET_H
