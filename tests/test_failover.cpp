/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: test_failover.cpp

    Description:
        Tests for primary/standby failover: beacon expiry, snapshot merging
        into the replica file, promotion after the primary goes silent, and
        seeding from the durable resource file when no snapshot ever arrived.
*******************************************************************************/

#include "failover/heartbeat_monitor.h"
#include "failover/primary_feeds.h"
#include "failover/standby_replica.h"
#include "broker/broker.h"
#include "worker/worker.h"
#include "client/allocation_client.h"
#include "resources/resource_store.h"
#include "common/protocol.h"
#include "common/logger.h"

#include <iostream>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <thread>
#include <unistd.h>
#include <sys/stat.h>

using namespace roomalloc;

static std::string temp_path(const std::string& name) {
    return "/tmp/roomalloc_failover_" + std::to_string(getpid()) + "_" + name + ".csv";
}

static void write_table(const std::string& path, int rooms) {
    std::ofstream file(path);
    file << "id,kind,status,capacity,requester,program,requested_at,assigned_at\n";
    for (int i = 1; i <= rooms; ++i) {
        file << "S" << i << ",room,available,30,,,,\n";
    }
}

static bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

static bool wait_until(const std::function<bool()>& condition, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}

static BrokerConfig make_broker_config(uint16_t frontend, uint16_t backend) {
    BrokerConfig config;
    config.frontend_port = frontend;
    config.backend_port = backend;
    config.poll_timeout_ms = 20;
    config.stats_interval_sec = 0;
    return config;
}

static StandbyConfig make_standby_config(uint16_t heartbeat, uint16_t sync, uint16_t backend,
                                         const std::string& replica, const std::string& resources) {
    StandbyConfig config;
    config.failover.primary_host = "127.0.0.1";
    config.failover.heartbeat_port = heartbeat;
    config.failover.sync_port = sync;
    config.failover.heartbeat_timeout_ms = 600;
    config.failover.check_interval_ms = 100;
    config.worker.broker_host = "127.0.0.1";
    config.worker.broker_port = backend;
    config.worker.max_concurrent_requests = 4;
    config.worker.poll_timeout_ms = 50;
    config.replica_file = replica;
    config.resource_file = resources;
    return config;
}

static AllocationRequest make_request(const std::string& requester, int rooms) {
    AllocationRequest request;
    request.requester = requester;
    request.program = "Program";
    request.term = 1;
    request.rooms_requested = rooms;
    request.labs_requested = 0;
    return request;
}

int main() {
    Logger::set_level(LogLevel::WARNING);
    std::cout << "Running failover tests...\n";

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Heartbeat monitor expiry and timing check... ";
        try {
            HeartbeatMonitor monitor;
            assert(!monitor.expired(1000));
            assert(monitor.beacons_received() == 0);

            std::this_thread::sleep_for(std::chrono::milliseconds(80));
            assert(monitor.expired(20));

            monitor.record_beacon();
            assert(!monitor.expired(1000));
            assert(monitor.millis_since_last() < 1000);
            assert(monitor.beacons_received() == 1);

            FailoverConfig timing;
            assert(timing.timeout_exceeds_period());
            timing.heartbeat_period_ms = 100;
            timing.heartbeat_timeout_ms = 100;
            assert(!timing.timeout_exceeds_period());
            timing.heartbeat_timeout_ms = 600;
            assert(timing.timeout_exceeds_period());
            // The check follows the configured period, not the default one
            timing.heartbeat_period_ms = 3000;
            timing.heartbeat_timeout_ms = 2500;
            assert(!timing.timeout_exceeds_period());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Snapshot merge is idempotent and persisted... ";
        try {
            std::string replica = temp_path("merge");
            StandbyReplica standby(make_standby_config(17701, 17702, 17703, replica, "unused.csv"));
            assert(standby.state() == StandbyState::STANDBY);

            Resource room("S1", ResourceKind::FIXED_ROOM, 30);
            Resource lab("L1", ResourceKind::LAB, 20);
            lab.assign("Sciences", "Biology", "2026-10-19T10:00:00.000");
            std::string payload = encode_snapshot({room, lab});

            assert(standby.apply_snapshot_payload(payload));
            auto first = standby.table().snapshot();
            assert(standby.apply_snapshot_payload(payload));
            auto second = standby.table().snapshot();

            assert(first.size() == 2);
            assert(second.size() == first.size());
            for (size_t i = 0; i < first.size(); ++i) {
                assert(first[i] == second[i]);
            }
            assert(standby.snapshots_applied() == 2);

            assert(!standby.apply_snapshot_payload("{\"resources\":42}"));
            assert(!standby.apply_snapshot_payload("garbage"));
            assert(standby.snapshots_applied() == 2);

            auto persisted = ResourceStore(replica).load();
            assert(persisted.size() == 2);

            std::remove(replica.c_str());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Standby takes over when the primary goes silent... ";
        try {
            std::string primary_file = temp_path("primary");
            std::string replica = temp_path("replica");
            write_table(primary_file, 4);

            Broker broker(make_broker_config(17711, 17712));
            assert(broker.start());

            ResourceTable primary_table(primary_file);
            assert(primary_table.load() == 4);

            WorkerConfig primary_config;
            primary_config.broker_host = "127.0.0.1";
            primary_config.broker_port = 17712;
            primary_config.identity = "primary";
            primary_config.poll_timeout_ms = 50;
            auto primary = std::make_unique<AllocatorWorker>(primary_config, primary_table);
            auto heartbeat = std::make_unique<HeartbeatPublisher>(17713, 100);
            auto sync = std::make_unique<StateSyncPublisher>(17714, 200, primary_table);
            assert(primary->start());
            assert(heartbeat->start());
            assert(sync->start());

            StandbyConfig standby_config = make_standby_config(17713, 17714, 17712,
                                                                replica, primary_file);
            standby_config.worker.identity = "standby";
            StandbyReplica standby(standby_config);
            assert(standby.start());

            ClientConfig client_config;
            client_config.broker_host = "127.0.0.1";
            client_config.broker_port = 17711;
            AllocationClient client(client_config);

            auto before = client.submit(make_request("Engineering", 1));
            assert(before.kind == ResponseKind::SUCCESS);
            const std::string taken = before.rooms_assigned[0];

            // The next periodic snapshot carries the assignment to the standby
            assert(wait_until([&]() {
                Resource r;
                return standby.table().find(taken, r) && !r.is_available();
            }, 5000));
            assert(standby.status().beacons_received > 0);
            assert(standby.state() == StandbyState::STANDBY);
            assert(file_exists(replica));

            sync->stop();
            heartbeat->stop();
            auto silenced = std::chrono::steady_clock::now();
            primary->stop();

            assert(wait_until([&]() { return standby.state() == StandbyState::ACTIVE; }, 5000));
            auto takeover_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - silenced).count();
            // Bounded by the beacon timeout plus one liveness check, with slack
            // for seeding, registration and the 20 ms wait granularity
            assert(takeover_ms <= standby_config.failover.heartbeat_timeout_ms +
                                  standby_config.failover.check_interval_ms + 400);

            auto after = client.submit(make_request("Sciences", 1));
            assert(after.kind == ResponseKind::SUCCESS);
            assert(after.rooms_assigned[0] != taken);

            // Only the standby's worker is registered and idle now
            assert(wait_until([&]() { return standby.status().requests_served == 1; }, 3000));
            Resource served;
            assert(standby.table().find(after.rooms_assigned[0], served));
            assert(served.requester == "Sciences");
            Resource untouched;
            assert(primary_table.find(after.rooms_assigned[0], untouched));
            assert(untouched.is_available());

            StandbyStatus status = standby.status();
            assert(status.state == StandbyState::ACTIVE);
            assert(status.resources == 4);

            client.close();
            standby.stop();
            broker.stop();
            std::remove(primary_file.c_str());
            std::remove(replica.c_str());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Activation without any snapshot seeds from the resource file... ";
        try {
            std::string resources = temp_path("seed_source");
            std::string replica = temp_path("seed_replica");
            write_table(resources, 3);
            std::remove(replica.c_str());

            Broker broker(make_broker_config(17721, 17722));
            assert(broker.start());

            // Nothing listens on the feed ports
            StandbyConfig config = make_standby_config(17723, 17724, 17722, replica, resources);
            config.failover.heartbeat_timeout_ms = 300;
            config.failover.check_interval_ms = 50;
            StandbyReplica standby(config);
            assert(standby.start());

            assert(wait_until([&]() { return standby.state() == StandbyState::ACTIVE; }, 5000));
            assert(standby.snapshots_applied() == 0);
            assert(standby.table().size() == 3);
            assert(file_exists(replica));

            ClientConfig client_config;
            client_config.broker_host = "127.0.0.1";
            client_config.broker_port = 17721;
            AllocationClient client(client_config);
            auto response = client.submit(make_request("Arts", 2));
            assert(response.kind == ResponseKind::SUCCESS);
            assert(response.rooms_assigned.size() == 2);

            // The promoted table writes to the replica file, not the seed source
            for (const auto& r : ResourceStore(resources).load()) {
                assert(r.is_available());
            }

            client.close();
            standby.stop();
            broker.stop();
            std::remove(resources.c_str());
            std::remove(replica.c_str());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Failed seeding leaves the replica in standby... ";
        try {
            std::string replica = temp_path("no_seed");
            std::remove(replica.c_str());

            StandbyConfig config = make_standby_config(17731, 17732, 17733, replica,
                                                       "/nonexistent/dir/resources.csv");
            config.failover.heartbeat_timeout_ms = 100;
            config.failover.check_interval_ms = 50;
            StandbyReplica standby(config);
            assert(standby.start());

            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            assert(standby.state() != StandbyState::ACTIVE);
            assert(standby.table().size() == 0);

            standby.stop();
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
