/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: worker.h

    Description:
        The allocator worker: connects to the broker backend, announces itself
        with READY, and serves dispatched allocation requests against its
        resource table with bounded concurrency.

        Worker nodes never talk to each other. The primary runs one of these
        (main_worker.cpp); a standby replica builds one when it promotes
        itself (failover/standby_replica.h).

    Thread Model:
        1. Dispatch thread: admission and intake
               acquire permit (100 ms slices, so stop() is noticed)
               -> receive one dispatch (100 ms slices)
               -> hand it to a fresh request thread
               -> READY again while permits remain
        2. Request threads (one per admitted request, detached):
               process_payload() -> reply -> release permit -> READY

        A message is only taken off the broker connection while a permit is
        held, so at most max_concurrent_requests requests are ever being
        processed; anything beyond that waits in the socket.

    Reply Guarantee:
        Every admitted request produces exactly one reply (success,
        unavailable, or error). The permit is released and READY re-sent on
        every path out of a request thread, including exceptions.

    Shutdown:
        stop() ends the dispatch thread, then waits until every request
        thread has replied before closing the broker connection.
*******************************************************************************/

#ifndef WORKER_H
#define WORKER_H

#include "common/semaphore.h"
#include "net/dealer.h"
#include "resources/resource_table.h"
#include "worker/request_pipeline.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace roomalloc {

struct WorkerConfig {
    std::string broker_host = "localhost";
    uint16_t broker_port = 5556;
    std::string identity;                 // empty = generated
    int max_concurrent_requests = 10;
    int poll_timeout_ms = 100;
    int send_timeout_ms = 5000;
};

class AllocatorWorker {
private:
    WorkerConfig config_;
    RequestHandler handler_;
    net::DealerConnection connection_;
    CountingSemaphore permits_;

    std::atomic<bool> running_;
    std::thread dispatch_thread_;

    std::atomic<int> in_flight_;
    std::atomic<int> peak_in_flight_;
    std::atomic<uint64_t> processed_;
    int request_threads_;                 // guarded by drain_mutex_
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;

    void dispatch_loop();
    void handle_request(std::string client, std::string payload);
    bool send_ready();

public:
    // Serves requests from `table` through the logging and statistics
    // middleware. The table must outlive the worker.
    AllocatorWorker(const WorkerConfig& config, ResourceTable& table);
    AllocatorWorker(const WorkerConfig& config, RequestHandler handler);
    ~AllocatorWorker();

    AllocatorWorker(const AllocatorWorker&) = delete;
    AllocatorWorker& operator=(const AllocatorWorker&) = delete;

    // Connects to the broker and registers. false if the broker is
    // unreachable.
    bool start();
    void stop();

    bool is_running() const { return running_; }
    bool is_connected() const { return connection_.connected(); }
    const std::string& identity() const { return config_.identity; }

    int in_flight() const { return in_flight_; }
    int peak_in_flight() const { return peak_in_flight_; }
    uint64_t processed() const { return processed_; }
    int free_permits() const { return permits_.available(); }
    int capacity() const { return permits_.capacity(); }

    static std::string generate_identity(const std::string& prefix);
};

} // namespace roomalloc

#endif // WORKER_H
