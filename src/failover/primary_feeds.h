/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: primary_feeds.h

    Description:
        The two broadcast feeds the active primary runs for its standby:

        HeartbeatPublisher  "HEARTBEAT <ISO-8601>" every heartbeat_period_ms
        StateSyncPublisher  full table snapshot every sync_period_ms

        Both are fire-and-forget: nothing is acknowledged, nothing is resent,
        and a standby that is not connected simply misses the message. Each
        publisher owns one background thread that sleeps in short slices so
        stop() returns promptly.
*******************************************************************************/

#ifndef PRIMARY_FEEDS_H
#define PRIMARY_FEEDS_H

#include "net/pubsub.h"
#include "resources/resource_table.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace roomalloc {

struct FailoverConfig {
    std::string primary_host = "localhost";
    uint16_t heartbeat_port = 5560;
    uint16_t sync_port = 5561;
    int heartbeat_period_ms = 2000;
    int heartbeat_timeout_ms = 5000;
    int check_interval_ms = 500;
    int sync_period_ms = 10000;

    // A standby must allow at least one missed beacon before taking over
    bool timeout_exceeds_period() const {
        return heartbeat_timeout_ms > heartbeat_period_ms;
    }
};

class HeartbeatPublisher {
private:
    uint16_t port_;
    int period_ms_;
    net::Publisher publisher_;
    std::atomic<bool> running_;
    std::thread thread_;
    std::atomic<uint64_t> beacons_sent_;

    void publish_loop();

public:
    HeartbeatPublisher(uint16_t port, int period_ms);
    ~HeartbeatPublisher();

    bool start();
    void stop();

    uint64_t beacons_sent() const { return beacons_sent_; }
};

class StateSyncPublisher {
private:
    uint16_t port_;
    int period_ms_;
    const ResourceTable& table_;
    net::Publisher publisher_;
    std::atomic<bool> running_;
    std::thread thread_;
    std::atomic<uint64_t> snapshots_sent_;

    void publish_loop();

public:
    StateSyncPublisher(uint16_t port, int period_ms, const ResourceTable& table);
    ~StateSyncPublisher();

    bool start();
    void stop();

    // Publishes one snapshot now; returns the number of subscribers reached.
    size_t publish_snapshot();

    uint64_t snapshots_sent() const { return snapshots_sent_; }
};

// Sleeps up to total_ms in short slices; returns early once `running` drops.
void sleep_while_running(const std::atomic<bool>& running, int total_ms);

} // namespace roomalloc

#endif // PRIMARY_FEEDS_H
