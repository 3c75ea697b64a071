/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: pubsub.cpp
*******************************************************************************/

#include "net/pubsub.h"
#include "net/socket_utils.h"
#include "common/errors.h"
#include "common/logger.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>

namespace roomalloc {
namespace net {

//==============================================================================
// Publisher
//==============================================================================

Publisher::Publisher(const std::string& name, int send_timeout_ms)
    : name_(name),
      listen_fd_(-1),
      running_(false),
      send_timeout_ms_(send_timeout_ms) {
}

Publisher::~Publisher() {
    stop();
}

bool Publisher::bind(uint16_t port) {
    if (running_) {
        Logger::warning("Publisher " + name_ + " already running");
        return false;
    }

    listen_fd_ = create_listener(port);
    if (listen_fd_ < 0) {
        return false;
    }

    running_ = true;
    accept_thread_ = std::thread(&Publisher::accept_loop, this);
    Logger::info("Publisher " + name_ + " bound to port " + std::to_string(port));
    return true;
}

void Publisher::stop() {
    if (!running_) return;
    running_ = false;

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    close_socket(listen_fd_);

    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    for (int& fd : subscribers_) {
        close_socket(fd);
    }
    subscribers_.clear();
    Logger::info("Publisher " + name_ + " stopped");
}

void Publisher::accept_loop() {
    while (running_) {
        if (wait_readable(listen_fd_, 100) <= 0) {
            continue;
        }

        int fd = accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
            if (running_ && errno != EINTR) {
                Logger::error("Accept failed on " + name_ + ": " +
                              std::string(strerror(errno)));
            }
            continue;
        }
        set_timeouts(fd, send_timeout_ms_, 0);

        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        subscribers_.push_back(fd);
        Logger::debug("Publisher " + name_ + " subscriber connected (" +
                      std::to_string(subscribers_.size()) + " total)");
    }
}

size_t Publisher::publish(const std::string& payload) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);

    Multipart frames{payload};
    size_t delivered = 0;
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
        if (write_message(*it, frames)) {
            delivered++;
            ++it;
        } else {
            Logger::debug("Publisher " + name_ + " dropping subscriber");
            int fd = *it;
            close_socket(fd);
            it = subscribers_.erase(it);
        }
    }
    return delivered;
}

size_t Publisher::subscriber_count() {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.size();
}

//==============================================================================
// Subscriber
//==============================================================================

Subscriber::Subscriber(const std::string& host, uint16_t port)
    : host_(host), port_(port), fd_(-1) {
}

Subscriber::~Subscriber() {
    close();
}

void Subscriber::close() {
    close_socket(fd_);
}

bool Subscriber::ensure_connected(int timeout_ms) {
    if (fd_ >= 0) return true;

    fd_ = connect_to(host_, port_);
    if (fd_ < 0) {
        // Publisher not up yet; do not spin
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        return false;
    }
    Logger::debug("Subscribed to " + host_ + ":" + std::to_string(port_));
    return true;
}

bool Subscriber::receive(std::string& payload, int timeout_ms) {
    if (!ensure_connected(timeout_ms)) {
        return false;
    }

    int ready = wait_readable(fd_, timeout_ms);
    if (ready == 0) {
        return false;
    }

    try {
        Multipart frames;
        if (ready > 0 && read_message(fd_, frames) && frames.size() == 1) {
            payload = frames[0];
            return true;
        }
    } catch (const ProtocolError& e) {
        Logger::warning("Feed " + host_ + ":" + std::to_string(port_) +
                        " sent garbage: " + e.what());
    }

    Logger::debug("Feed " + host_ + ":" + std::to_string(port_) + " disconnected");
    close_socket(fd_);
    return false;
}

} // namespace net
} // namespace roomalloc
