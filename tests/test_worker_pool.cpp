/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: test_worker_pool.cpp

    Description:
        Tests for the broker's routing metadata: FIFO idle order, idempotent
        registration and pending dispatch bookkeeping.
*******************************************************************************/

#include "broker/worker_pool.h"

#include <iostream>
#include <cassert>
#include <stdexcept>

using namespace roomalloc;

int main() {
    std::cout << "Running worker pool tests...\n";

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Idle workers are served in FIFO order... ";
        try {
            WorkerPool pool;
            assert(pool.register_worker("w1"));
            assert(pool.register_worker("w2"));
            assert(pool.register_worker("w3"));

            assert(pool.next_worker() == "w1");
            assert(pool.next_worker() == "w2");

            // w1 comes back behind w3
            pool.mark_idle("w1");
            assert(pool.next_worker() == "w3");
            assert(pool.next_worker() == "w1");
            assert(!pool.has_idle());
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Repeated READY never duplicates a worker... ";
        try {
            WorkerPool pool;
            assert(pool.register_worker("w1"));
            assert(!pool.register_worker("w1"));
            pool.mark_idle("w1");
            pool.register_worker("w2");
            pool.mark_idle("w1");

            assert(pool.registered_count() == 2);
            assert(pool.idle_count() == 2);
            assert(pool.dedup_idle() == 0);
            assert(pool.idle_order() == std::vector<std::string>({"w1", "w2"}));
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Empty idle queue throws... ";
        try {
            WorkerPool pool;
            bool threw = false;
            try {
                pool.next_worker();
            } catch (const std::logic_error&) {
                threw = true;
            }
            assert(threw);
            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Dispatch bookkeeping and worker states... ";
        try {
            WorkerPool pool;
            pool.register_worker("w1");
            pool.register_worker("w2");
            assert(pool.state_of("w1") == WorkerState::IDLE);
            assert(pool.state_of("ghost") == WorkerState::UNKNOWN);

            std::string worker = pool.next_worker();
            assert(pool.state_of(worker) == WorkerState::REGISTERED);

            pool.record_dispatch("client-a", worker);
            pool.record_dispatch("client-a", "w2");
            pool.next_worker();
            assert(pool.state_of("w1") == WorkerState::BUSY);
            assert(pool.in_flight() == 2);
            assert(pool.waiting_clients() == 1);

            assert(pool.complete_dispatch("client-a", "w1"));
            assert(!pool.complete_dispatch("client-a", "w1"));
            assert(!pool.complete_dispatch("client-b", "w2"));
            assert(pool.in_flight() == 1);

            pool.mark_idle("w1");
            assert(pool.state_of("w1") == WorkerState::IDLE);
            assert(worker_state_to_string(pool.state_of("w2")) == "BUSY");
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
