/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: standby_replica.h

    Description:
        Warm standby for the primary allocator. While idle it consumes the
        primary's heartbeat and state-sync feeds; when the heartbeat has been
        silent for longer than the timeout it promotes itself into an
        allocator worker over its replicated table and registers with the
        broker like any other pool member.

        State Machine (terminal for the process lifetime):

            STANDBY ──(no beacon for > heartbeat_timeout_ms)──► ACTIVATING
               ▲                                                   │
               └──────────── seeding or registration failed ───────┤
                                                                   ▼
                                                                ACTIVE

        Threads:
        1. heartbeat listener: records beacon arrival in HeartbeatMonitor
        2. sync listener:      upserts every snapshot into the table and
                               rewrites the replica file; keeps running
                               after promotion
        3. liveness checker:   every check_interval_ms compares the beacon
                               gap against the timeout, runs activation

        Table Seeding:
        - at start, from replica_file if it exists (previous run)
        - from every received snapshot (asymmetric upsert, never deletes)
        - at activation, from resource_file only if no snapshot was applied
          and the table is still empty

        A primary that comes back does not demote an ACTIVE standby; both
        stay registered with the broker.
*******************************************************************************/

#ifndef STANDBY_REPLICA_H
#define STANDBY_REPLICA_H

#include "failover/heartbeat_monitor.h"
#include "failover/primary_feeds.h"
#include "resources/resource_table.h"
#include "worker/worker.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace roomalloc {

enum class StandbyState {
    STANDBY,
    ACTIVATING,
    ACTIVE
};

std::string standby_state_to_string(StandbyState state);

struct StandbyConfig {
    FailoverConfig failover;
    WorkerConfig worker;
    std::string replica_file = "standby_resources.csv";
    std::string resource_file = "resources.csv";
};

struct StandbyStatus {
    StandbyState state;
    int in_flight;
    int free_permits;
    int capacity;
    int64_t millis_since_beacon;
    uint64_t beacons_received;
    uint64_t snapshots_applied;
    uint64_t requests_served;
    size_t resources;

    std::string to_string() const;
};

class StandbyReplica {
private:
    StandbyConfig config_;
    ResourceTable table_;
    HeartbeatMonitor monitor_;

    mutable std::mutex state_mutex_;
    StandbyState state_;
    std::unique_ptr<AllocatorWorker> worker_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> snapshots_applied_;
    std::thread heartbeat_thread_;
    std::thread sync_thread_;
    std::thread liveness_thread_;

    void heartbeat_loop();
    void sync_loop();
    void liveness_loop();
    bool activate();
    void set_state(StandbyState state);

public:
    explicit StandbyReplica(const StandbyConfig& config);
    ~StandbyReplica();

    StandbyReplica(const StandbyReplica&) = delete;
    StandbyReplica& operator=(const StandbyReplica&) = delete;

    bool start();
    void stop();

    // Applies one snapshot payload as the sync listener does. false if the
    // payload does not decode.
    bool apply_snapshot_payload(const std::string& payload);

    StandbyState state() const;
    StandbyStatus status() const;
    uint64_t snapshots_applied() const { return snapshots_applied_; }
    const ResourceTable& table() const { return table_; }
};

} // namespace roomalloc

#endif // STANDBY_REPLICA_H
