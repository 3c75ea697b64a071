/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: test_worker.cpp

    Description:
        Tests for the allocator worker behind a real broker: the admission
        bound, exclusive assignment through the shared table, error replies
        and draining on stop(). The request pipeline's error boundary is
        tested directly.
*******************************************************************************/

#include "broker/broker.h"
#include "worker/worker.h"
#include "worker/request_pipeline.h"
#include "client/allocation_client.h"
#include "resources/resource_table.h"
#include "common/errors.h"
#include "common/logger.h"

#include <iostream>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace roomalloc;

static BrokerConfig make_broker_config(uint16_t frontend, uint16_t backend) {
    BrokerConfig config;
    config.frontend_port = frontend;
    config.backend_port = backend;
    config.poll_timeout_ms = 20;
    config.stats_interval_sec = 0;
    return config;
}

static WorkerConfig make_worker_config(uint16_t backend, int concurrency) {
    WorkerConfig config;
    config.broker_host = "127.0.0.1";
    config.broker_port = backend;
    config.max_concurrent_requests = concurrency;
    config.poll_timeout_ms = 50;
    return config;
}

static ClientConfig make_client_config(uint16_t frontend) {
    ClientConfig config;
    config.broker_host = "127.0.0.1";
    config.broker_port = frontend;
    config.recv_timeout_ms = 10000;
    return config;
}

static AllocationRequest make_request(const std::string& requester, int rooms, int labs) {
    AllocationRequest request;
    request.requester = requester;
    request.program = "Program";
    request.term = 1;
    request.rooms_requested = rooms;
    request.labs_requested = labs;
    return request;
}

static bool wait_for_workers(const Broker& broker, size_t count) {
    for (int i = 0; i < 300; ++i) {
        if (broker.registered_workers() >= count) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

int main() {
    Logger::set_level(LogLevel::WARNING);
    std::cout << "Running allocator worker tests...\n";

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Error boundary of the request pipeline... ";
        try {
            RequestHandler persistence_failure = [](const AllocationRequest&) -> AllocationResponse {
                throw PersistenceError("disk full");
            };
            RequestHandler crash = [](const AllocationRequest&) -> AllocationResponse {
                throw std::runtime_error("boom");
            };
            RequestHandler echo = [](const AllocationRequest& request) {
                AllocationResponse response;
                response.kind = ResponseKind::SUCCESS;
                response.requester = request.requester;
                response.program = request.program;
                response.term = request.term;
                return response;
            };

            std::string valid = to_json(make_request("Engineering", 1, 0));

            auto r1 = parse_response(process_payload(persistence_failure, valid));
            assert(r1.kind == ResponseKind::ERROR);
            assert(r1.message == "Failed to persist allocation");

            auto r2 = parse_response(process_payload(crash, valid));
            assert(r2.message == "Internal error: boom");

            auto r3 = parse_response(process_payload(echo, "{not json"));
            assert(r3.kind == ResponseKind::ERROR);

            auto r4 = parse_response(process_payload(echo,
                "{\"requester\":\"R\",\"program\":\"P\",\"term\":1,"
                "\"rooms_requested\":0,\"labs_requested\":0}"));
            assert(r4.kind == ResponseKind::ERROR);

            auto r5 = parse_response(process_payload(echo, valid));
            assert(r5.kind == ResponseKind::SUCCESS);
            assert(r5.requester == "Engineering");
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Admission bound holds with N+5 requests... ";
        try {
            const int capacity = 3;
            const int offered = capacity + 5;

            Broker broker(make_broker_config(17651, 17652));
            assert(broker.start());

            RequestHandler slow = [](const AllocationRequest& request) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                AllocationResponse response;
                response.kind = ResponseKind::SUCCESS;
                response.requester = request.requester;
                response.program = request.program;
                response.term = request.term;
                response.rooms_assigned = {"S1"};
                return response;
            };

            AllocatorWorker worker(make_worker_config(17652, capacity), slow);
            assert(worker.start());
            assert(worker.capacity() == capacity);
            assert(wait_for_workers(broker, 1));

            std::mutex results_mutex;
            int successes = 0;
            std::vector<std::thread> clients;
            for (int i = 0; i < offered; ++i) {
                clients.emplace_back([&, i]() {
                    AllocationClient client(make_client_config(17651));
                    try {
                        auto response = client.submit(make_request("Unit" + std::to_string(i), 1, 0));
                        std::lock_guard<std::mutex> lock(results_mutex);
                        if (response.kind == ResponseKind::SUCCESS) successes++;
                    } catch (const CommunicationError& e) {
                        std::lock_guard<std::mutex> lock(results_mutex);
                        std::cout << "(client " << i << ": " << e.what() << ") ";
                    }
                });
            }
            for (auto& t : clients) t.join();

            assert(successes == offered);
            assert(worker.peak_in_flight() <= capacity);
            assert(worker.peak_in_flight() >= 2);

            worker.stop();
            assert(worker.processed() == static_cast<uint64_t>(offered));
            assert(worker.in_flight() == 0);
            assert(worker.free_permits() == capacity);
            broker.stop();
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Concurrent requests through the table never share a room... ";
        try {
            std::string path = "/tmp/roomalloc_worker_" + std::to_string(getpid()) + ".csv";
            {
                std::ofstream file(path);
                file << "id,kind,status,capacity,requester,program,requested_at,assigned_at\n";
                for (int i = 1; i <= 4; ++i) {
                    file << "S" << i << ",room,available,30,,,,\n";
                }
            }

            ResourceTable table(path);
            assert(table.load() == 4);

            Broker broker(make_broker_config(17653, 17654));
            assert(broker.start());

            AllocatorWorker worker(make_worker_config(17654, 5), table);
            assert(worker.start());
            assert(wait_for_workers(broker, 1));

            std::mutex results_mutex;
            std::vector<std::string> assigned;
            int unavailable = 0;
            std::vector<std::thread> clients;
            for (int i = 0; i < 10; ++i) {
                clients.emplace_back([&, i]() {
                    AllocationClient client(make_client_config(17653));
                    auto response = client.submit(make_request("Unit" + std::to_string(i), 1, 0));
                    std::lock_guard<std::mutex> lock(results_mutex);
                    if (response.kind == ResponseKind::SUCCESS) {
                        assigned.insert(assigned.end(), response.rooms_assigned.begin(),
                                        response.rooms_assigned.end());
                    } else if (response.kind == ResponseKind::UNAVAILABLE) {
                        unavailable++;
                    }
                });
            }
            for (auto& t : clients) t.join();

            std::set<std::string> unique(assigned.begin(), assigned.end());
            assert(assigned.size() == 4);
            assert(unique.size() == 4);
            assert(unavailable == 6);

            worker.stop();
            broker.stop();
            std::remove(path.c_str());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Invalid request gets an error reply... ";
        try {
            Broker broker(make_broker_config(17655, 17656));
            assert(broker.start());

            RequestHandler never = [](const AllocationRequest&) -> AllocationResponse {
                throw std::logic_error("handler must not run");
            };
            AllocatorWorker worker(make_worker_config(17656, 2), never);
            assert(worker.start());
            assert(wait_for_workers(broker, 1));

            AllocationClient client(make_client_config(17655));
            auto reply = parse_response(client.submit_raw("{\"requester\":\"\",\"program\":\"P\"}"));
            assert(reply.kind == ResponseKind::ERROR);
            assert(reply.message.find("Internal error") == std::string::npos);

            // The same connection keeps working after an error reply
            reply = parse_response(client.submit_raw("[]"));
            assert(reply.kind == ResponseKind::ERROR);

            client.close();
            worker.stop();
            assert(worker.processed() == 2);
            broker.stop();
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: stop() waits for requests in progress... ";
        try {
            Broker broker(make_broker_config(17657, 17658));
            assert(broker.start());

            RequestHandler slow = [](const AllocationRequest&) {
                std::this_thread::sleep_for(std::chrono::milliseconds(400));
                return AllocationResponse::unavailable("none");
            };
            AllocatorWorker worker(make_worker_config(17658, 2), slow);
            assert(worker.start());
            assert(wait_for_workers(broker, 1));

            ResponseKind kind = ResponseKind::SUCCESS;
            std::thread submitter([&]() {
                AllocationClient client(make_client_config(17657));
                kind = client.submit(make_request("Late", 1, 0)).kind;
            });

            for (int i = 0; i < 300 && worker.in_flight() == 0; ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            assert(worker.in_flight() == 1);

            worker.stop();
            assert(worker.processed() == 1);
            assert(!worker.is_running());

            submitter.join();
            assert(kind == ResponseKind::UNAVAILABLE);
            broker.stop();
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Unreachable broker fails start()... ";
        try {
            AllocatorWorker worker(make_worker_config(17659, 1),
                                   [](const AllocationRequest&) {
                                       return AllocationResponse::unavailable("x");
                                   });
            assert(!worker.start());
            assert(!worker.is_running());
            assert(worker.identity().find("worker-") == 0);
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
