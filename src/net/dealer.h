/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: dealer.h

    Description:
        Client side of an addressed channel: one TCP connection to a
        RouterEndpoint, announced with a fixed identity. Used by allocator
        workers (to the broker backend) and by the submission client (to the
        broker frontend).

    Threading:
        send() may be called from any thread (a send mutex keeps frames of
        concurrent replies from interleaving). receive() is meant for a single
        reader thread.
*******************************************************************************/

#ifndef DEALER_H
#define DEALER_H

#include "common/message.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace roomalloc {
namespace net {

class DealerConnection {
private:
    int fd_;
    std::string identity_;
    std::atomic<bool> connected_;
    std::mutex send_mutex_;
    std::mutex recv_mutex_;

public:
    DealerConnection();
    ~DealerConnection();

    DealerConnection(const DealerConnection&) = delete;
    DealerConnection& operator=(const DealerConnection&) = delete;

    // Connects and sends the identity greeting. send_timeout_ms bounds every
    // later send() (0 = no deadline).
    bool connect(const std::string& host, uint16_t port,
                 const std::string& identity, int send_timeout_ms = 5000);

    void close();

    bool send(const Multipart& frames);

    // Waits at most timeout_ms for one message. Returns false on timeout or
    // when the connection is lost (connected() tells the two apart).
    bool receive(Multipart& out, int timeout_ms);

    bool connected() const { return connected_; }
    const std::string& identity() const { return identity_; }
};

} // namespace net
} // namespace roomalloc

#endif // DEALER_H
