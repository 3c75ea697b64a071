/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: main_standby.cpp

    Description:
        Entry point of the standby replica. Follows the primary's heartbeat
        and state-sync feeds and takes over as an allocator worker when the
        primary goes silent. Logs a status line every few seconds.

    Usage:
        ./roomalloc_standby --primary-host localhost --replica-file standby.csv \
                            --resources data/resources.csv
*******************************************************************************/

#include "failover/standby_replica.h"
#include "common/logger.h"

#include <iostream>
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
              << "  --primary-host HOST    Host of the primary feeds (default: localhost)\n"
              << "  --heartbeat-port PORT  Heartbeat feed port (default: 5560)\n"
              << "  --sync-port PORT       State-sync feed port (default: 5561)\n"
              << "  --heartbeat-ms MS      Primary's heartbeat period (default: 2000)\n"
              << "  --timeout-ms MS        Heartbeat timeout (default: 5000)\n"
              << "  --check-ms MS          Liveness check period (default: 500)\n"
              << "  --replica-file FILE    Standby's own table copy (default: standby_resources.csv)\n"
              << "  --resources FILE       Durable table used if no snapshot arrived\n"
              << "                         (default: resources.csv)\n"
              << "  --broker-host HOST     Broker hostname (default: localhost)\n"
              << "  --broker-port PORT     Broker backend port (default: 5556)\n"
              << "  --concurrency N        Max concurrent requests once active (default: 10)\n"
              << "  --status-sec SEC       Status log period (default: 5)\n"
              << "  --log-level LEVEL      debug|info|warning|error (default: info)\n"
              << "  --log-file FILE        Mirror log output to FILE (default: standby.log)\n"
              << "  --help                 Show this help message\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    StandbyConfig config;
    int status_sec = 5;
    std::string log_level = "info";
    std::string log_file = "standby.log";

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            else if (arg == "--primary-host" && i + 1 < argc) {
                config.failover.primary_host = argv[++i];
            }
            else if (arg == "--heartbeat-port" && i + 1 < argc) {
                config.failover.heartbeat_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (arg == "--sync-port" && i + 1 < argc) {
                config.failover.sync_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (arg == "--heartbeat-ms" && i + 1 < argc) {
                config.failover.heartbeat_period_ms = std::stoi(argv[++i]);
            }
            else if (arg == "--timeout-ms" && i + 1 < argc) {
                config.failover.heartbeat_timeout_ms = std::stoi(argv[++i]);
            }
            else if (arg == "--check-ms" && i + 1 < argc) {
                config.failover.check_interval_ms = std::stoi(argv[++i]);
            }
            else if (arg == "--replica-file" && i + 1 < argc) {
                config.replica_file = argv[++i];
            }
            else if (arg == "--resources" && i + 1 < argc) {
                config.resource_file = argv[++i];
            }
            else if (arg == "--broker-host" && i + 1 < argc) {
                config.worker.broker_host = argv[++i];
            }
            else if (arg == "--broker-port" && i + 1 < argc) {
                config.worker.broker_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (arg == "--concurrency" && i + 1 < argc) {
                config.worker.max_concurrent_requests = std::stoi(argv[++i]);
            }
            else if (arg == "--status-sec" && i + 1 < argc) {
                status_sec = std::stoi(argv[++i]);
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

    if (!config.failover.timeout_exceeds_period()) {
        std::cerr << "Heartbeat timeout must exceed the heartbeat period ("
                  << config.failover.heartbeat_period_ms << " ms)\n";
        return 1;
    }

    Logger::set_level(Logger::parse_level(log_level));
    if (!log_file.empty() && !Logger::set_log_file(log_file)) {
        std::cerr << "Cannot open log file " << log_file << "\n";
    }
    Logger::info("=== Room Allocation Standby ===");

    StandbyReplica standby(config);
    if (!standby.start()) {
        Logger::error("Failed to start standby");
        return 1;
    }

    auto last_status = std::chrono::steady_clock::now();
    while (!shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        auto now = std::chrono::steady_clock::now();
        if (status_sec > 0 && now - last_status >= std::chrono::seconds(status_sec)) {
            Logger::info("Standby status: " + standby.status().to_string());
            last_status = now;
        }
    }

    Logger::info("Shutting down...");
    standby.stop();
    Logger::info("Standby shutdown complete");
    return 0;
}
