/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: standby_replica.cpp
*******************************************************************************/

#include "failover/standby_replica.h"
#include "common/errors.h"
#include "common/logger.h"
#include "common/message.h"
#include "common/protocol.h"
#include "net/pubsub.h"
#include "resources/resource_store.h"

#include <sstream>

namespace roomalloc {

std::string standby_state_to_string(StandbyState state) {
    switch (state) {
        case StandbyState::STANDBY: return "STANDBY";
        case StandbyState::ACTIVATING: return "ACTIVATING";
        case StandbyState::ACTIVE: return "ACTIVE";
    }
    return "UNKNOWN";
}

std::string StandbyStatus::to_string() const {
    std::stringstream ss;
    ss << "state=" << standby_state_to_string(state)
       << " in_flight=" << in_flight
       << " free_permits=" << free_permits << "/" << capacity
       << " last_beacon=" << (millis_since_beacon / 1000.0) << "s ago"
       << " beacons=" << beacons_received
       << " snapshots=" << snapshots_applied
       << " served=" << requests_served
       << " resources=" << resources;
    return ss.str();
}

StandbyReplica::StandbyReplica(const StandbyConfig& config)
    : config_(config),
      table_(config.replica_file),
      state_(StandbyState::STANDBY),
      running_(false),
      snapshots_applied_(0) {
    if (config_.worker.identity.empty()) {
        config_.worker.identity = AllocatorWorker::generate_identity("standby");
    }
}

StandbyReplica::~StandbyReplica() {
    stop();
}

bool StandbyReplica::start() {
    if (running_) {
        Logger::warning("Standby already running");
        return false;
    }

    ResourceStore replica(config_.replica_file);
    if (replica.exists()) {
        try {
            size_t loaded = table_.load();
            Logger::info("Standby restored " + std::to_string(loaded) +
                         " resources from " + config_.replica_file);
        } catch (const PersistenceError& e) {
            Logger::warning(std::string("Ignoring replica file: ") + e.what());
        }
    }

    running_ = true;
    heartbeat_thread_ = std::thread(&StandbyReplica::heartbeat_loop, this);
    sync_thread_ = std::thread(&StandbyReplica::sync_loop, this);
    liveness_thread_ = std::thread(&StandbyReplica::liveness_loop, this);

    Logger::info("Standby watching primary " + config_.failover.primary_host +
                 " (heartbeat " + std::to_string(config_.failover.heartbeat_port) +
                 ", sync " + std::to_string(config_.failover.sync_port) +
                 ", timeout " + std::to_string(config_.failover.heartbeat_timeout_ms) + " ms)");
    return true;
}

void StandbyReplica::stop() {
    if (!running_) return;

    Logger::info("Stopping standby...");
    running_ = false;
    if (liveness_thread_.joinable()) liveness_thread_.join();
    if (heartbeat_thread_.joinable()) heartbeat_thread_.join();
    if (sync_thread_.joinable()) sync_thread_.join();

    std::unique_ptr<AllocatorWorker> worker;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        worker = std::move(worker_);
    }
    if (worker) {
        worker->stop();
    }
    Logger::info("Standby stopped");
}

void StandbyReplica::set_state(StandbyState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
}

StandbyState StandbyReplica::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

StandbyStatus StandbyReplica::status() const {
    StandbyStatus status;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status.state = state_;
        status.in_flight = worker_ ? worker_->in_flight() : 0;
        status.free_permits = worker_ ? worker_->free_permits()
                                      : config_.worker.max_concurrent_requests;
        status.capacity = config_.worker.max_concurrent_requests;
        status.requests_served = worker_ ? worker_->processed() : 0;
    }
    status.millis_since_beacon = monitor_.millis_since_last();
    status.beacons_received = monitor_.beacons_received();
    status.snapshots_applied = snapshots_applied_;
    status.resources = table_.size();
    return status;
}

void StandbyReplica::heartbeat_loop() {
    net::Subscriber feed(config_.failover.primary_host, config_.failover.heartbeat_port);
    std::string payload;
    const std::string tag = std::string(HEARTBEAT_TAG) + " ";

    while (running_) {
        if (!feed.receive(payload, 100)) {
            continue;
        }
        if (payload.compare(0, tag.size(), tag) != 0) {
            Logger::warning("Unexpected message on heartbeat feed");
            continue;
        }
        monitor_.record_beacon();
        Logger::debug("Beacon from primary: " + payload.substr(tag.size()));
    }
}

bool StandbyReplica::apply_snapshot_payload(const std::string& payload) {
    std::vector<Resource> rows;
    try {
        rows = decode_snapshot(payload);
    } catch (const ProtocolError& e) {
        Logger::warning(std::string("Discarding snapshot: ") + e.what());
        return false;
    }

    try {
        size_t changed = table_.apply_snapshot(rows, true);
        Logger::debug("Snapshot applied: " + std::to_string(rows.size()) + " resources, " +
                      std::to_string(changed) + " changed");
    } catch (const PersistenceError& e) {
        // The merge is in memory already; only the replica file is behind
        Logger::error(std::string("Failed to persist snapshot: ") + e.what());
    }
    snapshots_applied_++;
    return true;
}

void StandbyReplica::sync_loop() {
    net::Subscriber feed(config_.failover.primary_host, config_.failover.sync_port);
    std::string payload;

    while (running_) {
        if (feed.receive(payload, 100)) {
            apply_snapshot_payload(payload);
        }
    }
}

void StandbyReplica::liveness_loop() {
    while (running_) {
        sleep_while_running(running_, config_.failover.check_interval_ms);
        if (!running_) break;

        if (state() != StandbyState::STANDBY) {
            continue;
        }
        if (!monitor_.expired(config_.failover.heartbeat_timeout_ms)) {
            continue;
        }

        Logger::warning("No heartbeat from primary for " +
                        std::to_string(monitor_.millis_since_last()) +
                        " ms, activating standby");
        if (!activate()) {
            Logger::error("Activation failed, staying in standby");
        }
    }
}

bool StandbyReplica::activate() {
    set_state(StandbyState::ACTIVATING);

    if (snapshots_applied_ == 0 && table_.size() == 0) {
        Logger::info("No snapshot received, seeding from " + config_.resource_file);
        try {
            ResourceStore durable(config_.resource_file);
            table_.apply_snapshot(durable.load(), true);
        } catch (const PersistenceError& e) {
            Logger::error(std::string("Cannot seed resource table: ") + e.what());
            set_state(StandbyState::STANDBY);
            return false;
        }
    }

    auto worker = std::make_unique<AllocatorWorker>(config_.worker, table_);
    if (!worker->start()) {
        set_state(StandbyState::STANDBY);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        worker_ = std::move(worker);
        state_ = StandbyState::ACTIVE;
    }
    Logger::info("Standby is ACTIVE as worker " + config_.worker.identity + " with " +
                 std::to_string(table_.size()) + " resources");
    return true;
}

} // namespace roomalloc
