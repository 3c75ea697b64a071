/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: main_submit.cpp

    Description:
        Command-line submission client. Builds one allocation request from
        the flags, sends it through the broker and prints the reply. With
        --count N the same request is fired N times concurrently, one
        connection per request, and a summary is printed at the end.

    Usage:
        ./roomalloc_submit --requester Engineering --program Systems \
                           --rooms 3 --labs 2
        ./roomalloc_submit --requester Sciences --program Biology \
                           --rooms 1 --labs 1 --count 20
*******************************************************************************/

#include "client/allocation_client.h"
#include "common/errors.h"
#include "common/logger.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

using namespace roomalloc;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --broker-host HOST   Broker hostname (default: localhost)\n"
              << "  --broker-port PORT   Broker frontend port (default: 5555)\n"
              << "  --requester NAME     Requesting unit (required)\n"
              << "  --program NAME       Academic program (required)\n"
              << "  --term N             Academic term (default: 1)\n"
              << "  --rooms N            Rooms requested (default: 0)\n"
              << "  --labs N             Labs requested (default: 0)\n"
              << "  --min-capacity N     Minimum seats per resource (default: any)\n"
              << "  --count N            Concurrent copies of the request (default: 1)\n"
              << "  --timeout-ms MS      Reply deadline (default: 10000)\n"
              << "  --log-level LEVEL    debug|info|warning|error (default: warning)\n"
              << "  --help               Show this help\n";
}

std::string describe_response(const AllocationResponse& response) {
    std::stringstream ss;
    switch (response.kind) {
        case ResponseKind::SUCCESS:
            ss << "ASSIGNED to " << response.requester << " - " << response.program
               << " (term " << response.term << ")\n  rooms:";
            for (const auto& id : response.rooms_assigned) ss << " " << id;
            ss << "\n  labs: ";
            for (const auto& id : response.labs_assigned) ss << " " << id;
            if (!response.notice.empty()) {
                ss << "\n  notice: " << response.notice;
            }
            break;
        case ResponseKind::UNAVAILABLE:
            ss << "UNAVAILABLE: " << response.message;
            break;
        case ResponseKind::ERROR:
            ss << "ERROR: " << response.message;
            break;
    }
    return ss.str();
}

int main(int argc, char* argv[]) {
    ClientConfig config;
    AllocationRequest request;
    int count = 1;
    std::string log_level = "warning";

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            else if (arg == "--broker-host" && i + 1 < argc) {
                config.broker_host = argv[++i];
            }
            else if (arg == "--broker-port" && i + 1 < argc) {
                config.broker_port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (arg == "--requester" && i + 1 < argc) {
                request.requester = argv[++i];
            }
            else if (arg == "--program" && i + 1 < argc) {
                request.program = argv[++i];
            }
            else if (arg == "--term" && i + 1 < argc) {
                request.term = std::stoi(argv[++i]);
            }
            else if (arg == "--rooms" && i + 1 < argc) {
                request.rooms_requested = std::stoi(argv[++i]);
            }
            else if (arg == "--labs" && i + 1 < argc) {
                request.labs_requested = std::stoi(argv[++i]);
            }
            else if (arg == "--min-capacity" && i + 1 < argc) {
                request.min_capacity = std::stoi(argv[++i]);
            }
            else if (arg == "--count" && i + 1 < argc) {
                count = std::stoi(argv[++i]);
            }
            else if (arg == "--timeout-ms" && i + 1 < argc) {
                config.recv_timeout_ms = std::stoi(argv[++i]);
            }
            else if (arg == "--log-level" && i + 1 < argc) {
                log_level = argv[++i];
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

    if (request.requester.empty() || request.program.empty() || count < 1) {
        print_usage(argv[0]);
        return 1;
    }

    Logger::set_level(Logger::parse_level(log_level));

    std::mutex output_mutex;
    std::atomic<int> assigned(0);
    std::atomic<int> unavailable(0);
    std::atomic<int> errors(0);
    std::atomic<int> failed(0);

    auto start = std::chrono::steady_clock::now();

    auto submit_one = [&](int index) {
        AllocationClient client(config);
        std::string line;
        try {
            AllocationResponse response = client.submit(request);
            switch (response.kind) {
                case ResponseKind::SUCCESS: assigned++; break;
                case ResponseKind::UNAVAILABLE: unavailable++; break;
                case ResponseKind::ERROR: errors++; break;
            }
            line = describe_response(response);
        } catch (const CommunicationError& e) {
            failed++;
            line = std::string(e.timed_out() ? "TIMEOUT: " : "COMMUNICATION ERROR: ") +
                   e.what() + (e.retryable() ? " (retryable)" : "");
        }

        std::lock_guard<std::mutex> lock(output_mutex);
        if (count > 1) std::cout << "[" << index << "] ";
        std::cout << line << "\n";
    };

    if (count == 1) {
        submit_one(1);
    } else {
        std::vector<std::thread> threads;
        for (int i = 1; i <= count; ++i) {
            threads.emplace_back(submit_one, i);
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (count > 1) {
        std::cout << "\n=== Submission Summary ===\n"
                  << "Requests:    " << count << "\n"
                  << "Assigned:    " << assigned << "\n"
                  << "Unavailable: " << unavailable << "\n"
                  << "Errors:      " << errors << "\n"
                  << "Failed:      " << failed << "\n"
                  << "Total time:  " << elapsed << " ms\n";
    }

    return (failed == 0 && errors == 0) ? 0 : 1;
}
