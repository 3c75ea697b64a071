/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: pubsub.h

    Description:
        Fire-and-forget broadcast feed over TCP. The primary runs two
        publishers (heartbeat and state sync); the standby subscribes to both.

        Publisher:
        - binds a port; a background thread accepts subscribers
        - publish() writes one single-frame message to every subscriber and
          drops the ones whose send fails or times out
        - nothing is buffered for subscribers that are not yet connected

        Subscriber:
        - connects lazily and reconnects after a lost connection, so a
          standby can start before the primary
        - receive() waits at most the given time for the next message
*******************************************************************************/

#ifndef PUBSUB_H
#define PUBSUB_H

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace roomalloc {
namespace net {

class Publisher {
private:
    std::string name_;
    int listen_fd_;
    std::vector<int> subscribers_;
    std::mutex subscribers_mutex_;
    std::atomic<bool> running_;
    std::thread accept_thread_;
    int send_timeout_ms_;

    void accept_loop();

public:
    explicit Publisher(const std::string& name, int send_timeout_ms = 1000);
    ~Publisher();

    Publisher(const Publisher&) = delete;
    Publisher& operator=(const Publisher&) = delete;

    bool bind(uint16_t port);
    void stop();

    // Returns the number of subscribers the message reached.
    size_t publish(const std::string& payload);

    size_t subscriber_count();
};

class Subscriber {
private:
    std::string host_;
    uint16_t port_;
    int fd_;

    bool ensure_connected(int timeout_ms);

public:
    Subscriber(const std::string& host, uint16_t port);
    ~Subscriber();

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    bool receive(std::string& payload, int timeout_ms);

    bool connected() const { return fd_ >= 0; }
    void close();
};

} // namespace net
} // namespace roomalloc

#endif // PUBSUB_H
