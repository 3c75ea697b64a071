/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: main_worker.cpp

    Description:
        Entry point of an allocator worker. Loads the durable resource table,
        registers with the broker backend and serves allocation requests.

        Roles:
            primary  also runs the heartbeat and state-sync feeds consumed
                     by the standby replica (default)
            worker   plain pool member, no feeds

        --reset restores every resource to available (mobile rooms become
        fixed rooms again), persists the table and exits without connecting.

    Usage:
        ./roomalloc_worker --resources data/resources.csv --broker-port 5556
        ./roomalloc_worker --resources data/resources.csv --reset
*******************************************************************************/

#include "worker/worker.h"
#include "failover/primary_feeds.h"
#include "resources/resource_table.h"
#include "common/errors.h"
#include "common/logger.h"

#include <iostream>
#include <memory>
#include <signal.h>
#include <atomic>

using namespace roomalloc;

std::atomic<bool> shutdown_requested(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested = true;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --resources FILE       Resource table CSV (default: resources.csv)\n"
              << "  --broker-host HOST     Broker hostname (default: localhost)\n"
              << "  --broker-port PORT     Broker backend port (default: 5556)\n"
              << "  --identity NAME        Worker identity (default: generated)\n"
              << "  --concurrency N        Max concurrent requests (default: 10)\n"
              << "  --role ROLE            primary|worker (default: primary)\n"
              << "  --heartbeat-port PORT  Heartbeat feed port (default: 5560)\n"
              << "  --sync-port PORT       State-sync feed port (default: 5561)\n"
              << "  --heartbeat-ms MS      Heartbeat period (default: 2000)\n"
              << "  --sync-ms MS           State-sync period (default: 10000)\n"
              << "  --reset                Reset every resource to available and exit\n"
              << "  --log-level LEVEL      debug|info|warning|error (default: info)\n"
              << "  --log-file FILE        Mirror log output to FILE (default: worker.log)\n"
              << "  --help                 Show this help message\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    WorkerConfig config;
    FailoverConfig feeds;
    std::string resource_file = "resources.csv";
    std::string role = "primary";
    bool reset = false;
    std::string log_level = "info";
    std::string log_file = "worker.log";

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            else if (arg == "--resources" && i + 1 < argc) {
                resource_file = argv[++i];
            }
            else if (arg == "--broker-host" && i + 1 < argc) {
                config.broker_host = argv[++i];
            }
            else if (arg == "--broker-port" && i + 1 < argc) {
                config.broker_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (arg == "--identity" && i + 1 < argc) {
                config.identity = argv[++i];
            }
            else if (arg == "--concurrency" && i + 1 < argc) {
                config.max_concurrent_requests = std::stoi(argv[++i]);
            }
            else if (arg == "--role" && i + 1 < argc) {
                role = argv[++i];
            }
            else if (arg == "--heartbeat-port" && i + 1 < argc) {
                feeds.heartbeat_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (arg == "--sync-port" && i + 1 < argc) {
                feeds.sync_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (arg == "--heartbeat-ms" && i + 1 < argc) {
                feeds.heartbeat_period_ms = std::stoi(argv[++i]);
            }
            else if (arg == "--sync-ms" && i + 1 < argc) {
                feeds.sync_period_ms = std::stoi(argv[++i]);
            }
            else if (arg == "--reset") {
                reset = true;
            }
            else if (arg == "--log-level" && i + 1 < argc) {
                log_level = argv[++i];
            }
            else if (arg == "--log-file" && i + 1 < argc) {
                log_file = argv[++i];
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        return 1;
    }

    if (role != "primary" && role != "worker") {
        std::cerr << "Unknown role: " << role << "\n";
        return 1;
    }

    Logger::set_level(Logger::parse_level(log_level));
    if (!log_file.empty() && !Logger::set_log_file(log_file)) {
        std::cerr << "Cannot open log file " << log_file << "\n";
    }
    Logger::info("=== Room Allocation Worker (" + role + ") ===");

    ResourceTable table(resource_file);
    try {
        table.load();
    } catch (const PersistenceError& e) {
        Logger::error(e.what());
        return 1;
    }
    Logger::info("Table: " + table.stats().to_string());

    if (reset) {
        try {
            table.reset_all();
        } catch (const PersistenceError& e) {
            Logger::error(e.what());
            return 1;
        }
        Logger::info("Table: " + table.stats().to_string());
        return 0;
    }

    std::unique_ptr<HeartbeatPublisher> heartbeat;
    std::unique_ptr<StateSyncPublisher> sync_feed;
    if (role == "primary") {
        heartbeat = std::make_unique<HeartbeatPublisher>(feeds.heartbeat_port,
                                                         feeds.heartbeat_period_ms);
        sync_feed = std::make_unique<StateSyncPublisher>(feeds.sync_port,
                                                         feeds.sync_period_ms, table);
        if (!heartbeat->start() || !sync_feed->start()) {
            Logger::error("Failed to start primary feeds");
            return 1;
        }
    }

    AllocatorWorker worker(config, table);
    if (!worker.start()) {
        Logger::error("Failed to start worker");
        return 1;
    }

    Logger::info("Worker running. Press Ctrl+C to stop.");
    while (!shutdown_requested && worker.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Logger::info("Shutting down...");
    worker.stop();
    if (sync_feed) sync_feed->stop();
    if (heartbeat) heartbeat->stop();
    Logger::info("Worker shutdown complete");
    return 0;
}
