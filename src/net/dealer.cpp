/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: dealer.cpp
*******************************************************************************/

#include "net/dealer.h"
#include "net/socket_utils.h"
#include "common/errors.h"
#include "common/logger.h"

namespace roomalloc {
namespace net {

DealerConnection::DealerConnection() : fd_(-1), connected_(false) {
}

DealerConnection::~DealerConnection() {
    close();
}

bool DealerConnection::connect(const std::string& host, uint16_t port,
                               const std::string& identity, int send_timeout_ms) {
    if (connected_) {
        Logger::warning("Connection '" + identity_ + "' already open");
        return false;
    }

    fd_ = connect_to(host, port);
    if (fd_ < 0) {
        Logger::error("Failed to connect to " + host + ":" + std::to_string(port));
        return false;
    }
    set_timeouts(fd_, send_timeout_ms, 0);

    identity_ = identity;
    if (!write_message(fd_, Multipart{identity})) {
        Logger::error("Failed to send identity greeting to " + host + ":" +
                      std::to_string(port));
        close_socket(fd_);
        return false;
    }

    connected_ = true;
    return true;
}

void DealerConnection::close() {
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    std::lock_guard<std::mutex> recv_lock(recv_mutex_);
    connected_ = false;
    close_socket(fd_);
}

bool DealerConnection::send(const Multipart& frames) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (!connected_) {
        return false;
    }
    if (!write_message(fd_, frames)) {
        Logger::warning("Send failed on connection '" + identity_ + "'");
        connected_ = false;
        return false;
    }
    return true;
}

bool DealerConnection::receive(Multipart& out, int timeout_ms) {
    std::lock_guard<std::mutex> lock(recv_mutex_);
    if (!connected_) {
        return false;
    }

    int ready = wait_readable(fd_, timeout_ms);
    if (ready == 0) {
        return false;
    }

    try {
        if (ready > 0 && read_message(fd_, out)) {
            return true;
        }
    } catch (const ProtocolError& e) {
        Logger::warning("Connection '" + identity_ + "' received garbage: " + e.what());
    }

    Logger::warning("Connection '" + identity_ + "' lost");
    connected_ = false;
    return false;
}

} // namespace net
} // namespace roomalloc
