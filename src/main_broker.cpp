/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: main_broker.cpp

    Description:
        Entry point of the load-balancing broker. Binds the client frontend
        and the worker backend, then runs until SIGINT/SIGTERM.

    Usage:
        ./roomalloc_broker --frontend-port 5555 --backend-port 5556
*******************************************************************************/

#include "broker/broker.h"
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
              << "  --frontend-port PORT   Client-facing port (default: 5555)\n"
              << "  --backend-port PORT    Worker-facing port (default: 5556)\n"
              << "  --poll-ms MS           Event loop poll timeout (default: 100)\n"
              << "  --stats-sec SEC        Statistics log period, 0 = off (default: 5)\n"
              << "  --log-level LEVEL      debug|info|warning|error (default: info)\n"
              << "  --log-file FILE        Mirror log output to FILE (default: broker.log)\n"
              << "  --help                 Show this help message\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    BrokerConfig config;
    std::string log_level = "info";
    std::string log_file = "broker.log";

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            else if (arg == "--frontend-port" && i + 1 < argc) {
                config.frontend_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (arg == "--backend-port" && i + 1 < argc) {
                config.backend_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (arg == "--poll-ms" && i + 1 < argc) {
                config.poll_timeout_ms = std::stoi(argv[++i]);
            }
            else if (arg == "--stats-sec" && i + 1 < argc) {
                config.stats_interval_sec = std::stoi(argv[++i]);
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

    Logger::set_level(Logger::parse_level(log_level));
    if (!log_file.empty() && !Logger::set_log_file(log_file)) {
        std::cerr << "Cannot open log file " << log_file << "\n";
    }
    Logger::info("=== Room Allocation Broker ===");

    Broker broker(config);
    if (!broker.start()) {
        Logger::error("Failed to start broker");
        return 1;
    }

    Logger::info("Broker running. Press Ctrl+C to stop.");
    while (!shutdown_requested && broker.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Logger::info("Shutting down...");
    broker.stop();
    Logger::info("Broker shutdown complete");
    return 0;
}
