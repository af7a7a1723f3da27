#include "tcp_socket.h"
#include "logger.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

void set_error(std::string* error, const std::string& message) {
    if (error) *error = message;
}

void configure_stream(int sock) {
#ifdef __APPLE__
    int nosigpipe = 1;
    setsockopt(sock, SOL_SOCKET, SO_NOSIGPIPE, &nosigpipe, sizeof(nosigpipe));
#endif
    int nodelay = 1;
    if (setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) < 0) {
        LOG_DEBUG("TCP: Failed to set TCP_NODELAY: " + std::string(strerror(errno)));
    }
}

bool resolve_ipv4(const std::string& host, in_addr& out, std::string* error) {
    if (inet_pton(AF_INET, host.c_str(), &out) == 1) {
        return true;
    }
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || res == nullptr) {
        set_error(error, "cannot resolve '" + host + "': " + gai_strerror(rc));
        return false;
    }
    out = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return true;
}

} // namespace

int tcp_listen(int port, int backlog, int* bound_port, std::string* error) {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        set_error(error, "socket() failed: " + std::string(strerror(errno)));
        return -1;
    }

    int opt = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        set_error(error, "setsockopt(SO_REUSEADDR) failed: " + std::string(strerror(errno)));
        close(sock);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        set_error(error, "bind to port " + std::to_string(port) + " failed: " + std::string(strerror(errno)));
        close(sock);
        return -1;
    }
    if (listen(sock, backlog) < 0) {
        set_error(error, "listen() failed: " + std::string(strerror(errno)));
        close(sock);
        return -1;
    }

    if (bound_port) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        if (getsockname(sock, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
            *bound_port = ntohs(local.sin_port);
        } else {
            *bound_port = port;
        }
    }
    return sock;
}

int tcp_connect(const std::string& host, int port, int timeout_ms, std::string* error) {
    const std::string network_id = host + ":" + std::to_string(port);

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(static_cast<uint16_t>(port));
    if (!resolve_ipv4(host, dest.sin_addr, error)) {
        return -1;
    }

    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        set_error(error, "socket() failed: " + std::string(strerror(errno)));
        return -1;
    }
    configure_stream(sock);

    const int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);

    int result = ::connect(sock, reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (result < 0) {
        if (errno != EINPROGRESS) {
            set_error(error, "connect to " + network_id + " failed: " + std::string(strerror(errno)));
            close(sock);
            return -1;
        }

        fd_set write_fds;
        FD_ZERO(&write_fds);
        FD_SET(sock, &write_fds);
        timeval timeout;
        timeout.tv_sec = timeout_ms / 1000;
        timeout.tv_usec = (timeout_ms % 1000) * 1000;

        result = select(sock + 1, nullptr, &write_fds, nullptr, &timeout);
        if (result <= 0) {
            set_error(error, "connect to " + network_id + " failed: " +
                             (result == 0 ? std::string("timeout") : std::string(strerror(errno))));
            close(sock);
            return -1;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            set_error(error, "connect to " + network_id + " failed: " +
                             (so_error ? std::string(strerror(so_error)) : std::string("unknown error")));
            close(sock);
            return -1;
        }
    }

    // back to blocking; readers use select() with a timeout
    fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
    LOG_DEBUG("TCP: Connected to " + network_id + ", fd=" + std::to_string(sock));
    return sock;
}

bool tcp_send_all(int sock, const char* data, size_t len, std::string* error) {
    if (sock < 0) {
        set_error(error, "invalid socket");
        return false;
    }
    size_t total_sent = 0;
    while (total_sent < len) {
#ifdef __APPLE__
        ssize_t n = ::send(sock, data + total_sent, len - total_sent, 0);
#else
        ssize_t n = ::send(sock, data + total_sent, len - total_sent, MSG_NOSIGNAL);
#endif
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            set_error(error, "send failed: " + std::string(strerror(errno)));
            return false;
        }
        total_sent += static_cast<size_t>(n);
    }
    return true;
}

int tcp_wait_readable(int sock, int timeout_ms) {
    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(sock, &read_fds);
    timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    const int rc = select(sock + 1, &read_fds, nullptr, nullptr, &timeout);
    if (rc < 0) {
        return errno == EINTR ? 0 : -1;
    }
    return rc > 0 ? 1 : 0;
}

void tcp_close(int sock) {
    if (sock >= 0) {
        shutdown(sock, SHUT_RDWR);
        close(sock);
    }
}
