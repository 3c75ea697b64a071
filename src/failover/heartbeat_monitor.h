/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: heartbeat_monitor.h

    Description:
        Failure detector state of the standby: the instant the last beacon
        from the primary was observed. Beacon contents do not matter, only
        their arrival. The monitor starts "as if" a beacon had just arrived,
        so a standby started without a primary promotes itself one timeout
        later.
*******************************************************************************/

#ifndef HEARTBEAT_MONITOR_H
#define HEARTBEAT_MONITOR_H

#include <chrono>
#include <cstdint>
#include <mutex>

namespace roomalloc {

class HeartbeatMonitor {
private:
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point last_beacon_;
    uint64_t beacons_;

public:
    HeartbeatMonitor()
        : last_beacon_(std::chrono::steady_clock::now()), beacons_(0) {}

    void record_beacon() {
        std::lock_guard<std::mutex> lock(mutex_);
        last_beacon_ = std::chrono::steady_clock::now();
        beacons_++;
    }

    int64_t millis_since_last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - last_beacon_).count();
    }

    // Strictly greater: a gap of exactly timeout_ms is still alive.
    bool expired(int timeout_ms) const {
        return millis_since_last() > timeout_ms;
    }

    uint64_t beacons_received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return beacons_;
    }
};

} // namespace roomalloc

#endif // HEARTBEAT_MONITOR_H
