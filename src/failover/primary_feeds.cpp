/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: primary_feeds.cpp
*******************************************************************************/

#include "failover/primary_feeds.h"
#include "common/logger.h"
#include "common/message.h"
#include "common/protocol.h"

#include <algorithm>
#include <chrono>

namespace roomalloc {

void sleep_while_running(const std::atomic<bool>& running, int total_ms) {
    const int slice_ms = 50;
    int slept = 0;
    while (running && slept < total_ms) {
        int step = std::min(slice_ms, total_ms - slept);
        std::this_thread::sleep_for(std::chrono::milliseconds(step));
        slept += step;
    }
}

//==============================================================================
// HeartbeatPublisher
//==============================================================================

HeartbeatPublisher::HeartbeatPublisher(uint16_t port, int period_ms)
    : port_(port),
      period_ms_(period_ms),
      publisher_("heartbeat"),
      running_(false),
      beacons_sent_(0) {
}

HeartbeatPublisher::~HeartbeatPublisher() {
    stop();
}

bool HeartbeatPublisher::start() {
    if (running_) return false;

    if (!publisher_.bind(port_)) {
        Logger::error("Failed to start heartbeat feed on port " + std::to_string(port_));
        return false;
    }
    running_ = true;
    thread_ = std::thread(&HeartbeatPublisher::publish_loop, this);
    Logger::info("Heartbeat feed every " + std::to_string(period_ms_) + " ms");
    return true;
}

void HeartbeatPublisher::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    publisher_.stop();
}

void HeartbeatPublisher::publish_loop() {
    while (running_) {
        std::string beacon = std::string(HEARTBEAT_TAG) + " " + iso8601_now();
        size_t reached = publisher_.publish(beacon);
        beacons_sent_++;
        Logger::debug("Heartbeat sent to " + std::to_string(reached) + " subscribers");

        sleep_while_running(running_, period_ms_);
    }
}

//==============================================================================
// StateSyncPublisher
//==============================================================================

StateSyncPublisher::StateSyncPublisher(uint16_t port, int period_ms,
                                       const ResourceTable& table)
    : port_(port),
      period_ms_(period_ms),
      table_(table),
      publisher_("state-sync"),
      running_(false),
      snapshots_sent_(0) {
}

StateSyncPublisher::~StateSyncPublisher() {
    stop();
}

bool StateSyncPublisher::start() {
    if (running_) return false;

    if (!publisher_.bind(port_)) {
        Logger::error("Failed to start state-sync feed on port " + std::to_string(port_));
        return false;
    }
    running_ = true;
    thread_ = std::thread(&StateSyncPublisher::publish_loop, this);
    Logger::info("State-sync feed every " + std::to_string(period_ms_) + " ms");
    return true;
}

void StateSyncPublisher::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    publisher_.stop();
}

size_t StateSyncPublisher::publish_snapshot() {
    auto rows = table_.snapshot();
    size_t reached = publisher_.publish(encode_snapshot(rows));
    snapshots_sent_++;
    Logger::debug("Snapshot of " + std::to_string(rows.size()) + " resources sent to " +
                  std::to_string(reached) + " subscribers");
    return reached;
}

void StateSyncPublisher::publish_loop() {
    while (running_) {
        sleep_while_running(running_, period_ms_);
        if (!running_) break;

        try {
            publish_snapshot();
        } catch (const std::exception& e) {
            Logger::error("Failed to publish snapshot: " + std::string(e.what()));
        }
    }
}

} // namespace roomalloc
