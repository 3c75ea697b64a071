/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: socket_utils.cpp
*******************************************************************************/

#include "net/socket_utils.h"
#include "common/errors.h"
#include "common/logger.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace roomalloc {
namespace net {

int create_listener(uint16_t port, int backlog) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        Logger::error("Failed to create socket: " + std::string(strerror(errno)));
        return -1;
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        Logger::warning("Failed to set SO_REUSEADDR: " + std::string(strerror(errno)));
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port);

    if (bind(fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        Logger::error("Failed to bind port " + std::to_string(port) + ": " +
                      std::string(strerror(errno)));
        close_socket(fd);
        return -1;
    }

    if (listen(fd, backlog) < 0) {
        Logger::error("Failed to listen: " + std::string(strerror(errno)));
        close_socket(fd);
        return -1;
    }
    return fd;
}

int connect_to(const std::string& host, uint16_t port) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (rc != 0 || !result) {
        Logger::error("Failed to resolve hostname " + host + ": " + gai_strerror(rc));
        return -1;
    }

    int fd = socket(result->ai_family, result->ai_socktype, result->ai_protocol);
    if (fd < 0) {
        Logger::error("Failed to create socket: " + std::string(strerror(errno)));
        freeaddrinfo(result);
        return -1;
    }

    if (connect(fd, result->ai_addr, result->ai_addrlen) < 0) {
        Logger::debug("Failed to connect to " + host + ":" + std::to_string(port) +
                      ": " + std::string(strerror(errno)));
        freeaddrinfo(result);
        close_socket(fd);
        return -1;
    }
    freeaddrinfo(result);

    int opt = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
    return fd;
}

void close_socket(int& fd) {
    if (fd >= 0) {
        shutdown(fd, SHUT_RDWR);
        close(fd);
        fd = -1;
    }
}

static bool set_timeout(int fd, int option, int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    return setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
}

bool set_timeouts(int fd, int send_timeout_ms, int recv_timeout_ms) {
    if (!set_timeout(fd, SO_SNDTIMEO, send_timeout_ms) ||
        !set_timeout(fd, SO_RCVTIMEO, recv_timeout_ms)) {
        Logger::warning("Failed to set socket deadlines: " + std::string(strerror(errno)));
        return false;
    }
    return true;
}

int wait_readable(int fd, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int rc = poll(&pfd, 1, timeout_ms);
    if (rc < 0) {
        if (errno == EINTR) return 0;
        return -1;
    }
    if (rc == 0) {
        return 0;
    }
    // POLLHUP with pending data still reads; read_message() sees the EOF
    if (pfd.revents & (POLLIN | POLLHUP)) {
        return 1;
    }
    return -1;
}

bool write_message(int fd, const Multipart& frames) {
    if (fd < 0) return false;

    auto data = serialize_message(frames);
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t sent = send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            Logger::debug("Send failed on socket " + std::to_string(fd) + ": " +
                          std::string(strerror(errno)));
            return false;
        }
        offset += static_cast<size_t>(sent);
    }
    return true;
}

static bool recv_all(int fd, uint8_t* buffer, size_t size) {
    size_t offset = 0;
    while (offset < size) {
        ssize_t received = recv(fd, buffer + offset, size - offset, MSG_WAITALL);
        if (received == 0) {
            return false;
        }
        if (received < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        offset += static_cast<size_t>(received);
    }
    return true;
}

bool read_message(int fd, Multipart& out) {
    if (fd < 0) return false;

    uint32_t size;
    if (!recv_all(fd, reinterpret_cast<uint8_t*>(&size), sizeof(size))) {
        return false;
    }
    size = ntoh32(size);
    if (size == 0 || size > MAX_MESSAGE_SIZE) {
        throw ProtocolError("Invalid message size: " + std::to_string(size));
    }

    std::vector<uint8_t> data(size);
    if (!recv_all(fd, data.data(), size)) {
        return false;
    }
    out = deserialize_body(data.data(), data.size());
    return true;
}

} // namespace net
} // namespace roomalloc
