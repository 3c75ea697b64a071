/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: router.cpp
*******************************************************************************/

#include "net/router.h"
#include "net/socket_utils.h"
#include "common/errors.h"
#include "common/logger.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace roomalloc {
namespace net {

RouterEndpoint::RouterEndpoint(const std::string& name, int send_timeout_ms)
    : name_(name),
      listen_fd_(-1),
      port_(0),
      next_peer_(1),
      send_timeout_ms_(send_timeout_ms) {
}

RouterEndpoint::~RouterEndpoint() {
    close();
}

bool RouterEndpoint::bind(uint16_t port) {
    if (listen_fd_ >= 0) {
        Logger::warning("Endpoint " + name_ + " already bound");
        return false;
    }

    listen_fd_ = create_listener(port);
    if (listen_fd_ < 0) {
        return false;
    }
    fcntl(listen_fd_, F_SETFL, fcntl(listen_fd_, F_GETFL, 0) | O_NONBLOCK);
    port_ = port;

    Logger::info("Endpoint " + name_ + " bound to port " + std::to_string(port));
    return true;
}

void RouterEndpoint::close() {
    for (auto& [fd, conn] : connections_) {
        int to_close = fd;
        close_socket(to_close);
    }
    connections_.clear();
    by_identity_.clear();
    inbox_.clear();
    close_socket(listen_fd_);
}

void RouterEndpoint::accept_pending() {
    while (true) {
        struct sockaddr_in client_addr;
        socklen_t addr_len = sizeof(client_addr);
        int fd = accept(listen_fd_, (struct sockaddr*)&client_addr, &addr_len);
        if (fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                Logger::error("Accept failed on " + name_ + ": " +
                              std::string(strerror(errno)));
            }
            return;
        }

        int opt = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
        set_timeouts(fd, send_timeout_ms_, 0);

        char client_ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, INET_ADDRSTRLEN);
        Logger::debug("Endpoint " + name_ + " accepted connection from " +
                      std::string(client_ip));

        Connection conn;
        conn.fd = fd;
        connections_[fd] = conn;
    }
}

bool RouterEndpoint::read_available(Connection& conn) {
    uint8_t chunk[65536];
    while (true) {
        ssize_t received = recv(conn.fd, chunk, sizeof(chunk), MSG_DONTWAIT);
        if (received == 0) {
            return false;
        }
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR) continue;
            return false;
        }
        conn.buffer.insert(conn.buffer.end(), chunk, chunk + received);
    }

    try {
        Multipart frames;
        while (extract_message(conn.buffer, frames)) {
            if (!handle_frames(conn, frames)) {
                return false;
            }
        }
    } catch (const ProtocolError& e) {
        Logger::warning("Endpoint " + name_ + " dropping peer '" + conn.identity +
                        "': " + e.what());
        return false;
    }
    return true;
}

bool RouterEndpoint::handle_frames(Connection& conn, Multipart& frames) {
    if (!conn.identity.empty()) {
        RoutedMessage msg;
        msg.address = conn.identity;
        msg.frames = std::move(frames);
        inbox_.push_back(std::move(msg));
        return true;
    }

    // First message on the connection: the identity greeting
    if (frames.size() != 1) {
        Logger::warning("Endpoint " + name_ + " expected an identity greeting, got " +
                        describe(frames));
        return false;
    }

    std::string identity = frames[0];
    if (identity.empty() || by_identity_.count(identity) > 0) {
        if (!identity.empty()) {
            Logger::warning("Identity '" + identity + "' already connected to " + name_);
        }
        identity = "peer-" + std::to_string(next_peer_++);
    }
    conn.identity = identity;
    by_identity_[identity] = conn.fd;
    Logger::debug("Endpoint " + name_ + " peer connected: " + identity);
    return true;
}

void RouterEndpoint::drop_connection(int fd) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) return;

    if (!it->second.identity.empty()) {
        by_identity_.erase(it->second.identity);
        Logger::debug("Endpoint " + name_ + " peer disconnected: " + it->second.identity);
    }
    int to_close = fd;
    close_socket(to_close);
    connections_.erase(it);
}

size_t RouterEndpoint::poll(const std::vector<RouterEndpoint*>& endpoints, int timeout_ms) {
    std::vector<struct pollfd> fds;
    std::vector<RouterEndpoint*> owners;

    for (auto* endpoint : endpoints) {
        if (endpoint->listen_fd_ >= 0) {
            fds.push_back({endpoint->listen_fd_, POLLIN, 0});
            owners.push_back(endpoint);
        }
        for (auto& [fd, conn] : endpoint->connections_) {
            fds.push_back({fd, POLLIN, 0});
            owners.push_back(endpoint);
        }
    }

    int rc = ::poll(fds.data(), fds.size(), timeout_ms);
    if (rc < 0 && errno != EINTR) {
        Logger::error("poll failed: " + std::string(strerror(errno)));
    }

    if (rc > 0) {
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents == 0) continue;
            RouterEndpoint* owner = owners[i];

            if (fds[i].fd == owner->listen_fd_) {
                owner->accept_pending();
                continue;
            }

            auto it = owner->connections_.find(fds[i].fd);
            if (it == owner->connections_.end()) continue;
            if (!owner->read_available(it->second)) {
                owner->drop_connection(fds[i].fd);
            }
        }
    }

    size_t queued = 0;
    for (auto* endpoint : endpoints) {
        queued += endpoint->inbox_.size();
    }
    return queued;
}

bool RouterEndpoint::pop(RoutedMessage& out) {
    if (inbox_.empty()) return false;
    out = std::move(inbox_.front());
    inbox_.pop_front();
    return true;
}

void RouterEndpoint::requeue_front(const RoutedMessage& msg) {
    inbox_.push_front(msg);
}

bool RouterEndpoint::send(const std::string& address, const Multipart& frames) {
    auto it = by_identity_.find(address);
    if (it == by_identity_.end()) {
        Logger::warning("Endpoint " + name_ + " has no peer '" + address + "'");
        return false;
    }

    int fd = it->second;
    if (!write_message(fd, frames)) {
        Logger::warning("Endpoint " + name_ + " failed to send to '" + address + "'");
        drop_connection(fd);
        return false;
    }
    return true;
}

bool RouterEndpoint::is_connected(const std::string& address) const {
    return by_identity_.count(address) > 0;
}

} // namespace net
} // namespace roomalloc
