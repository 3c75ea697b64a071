/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: broker.h

    Description:
        Load-balancing broker between submission clients and allocator
        workers. It routes payloads by address only; the request content is
        opaque to it apart from a best-effort label for the logs.

        Architecture:

            clients (dealer) ──► frontend :5555 ─┐
                                                 │  idle queue (FIFO)
                                                 ▼
            workers (dealer) ◄─► backend  :5556 ─┘

        Event Loop (single thread, no locks):
        1. poll the backend, and the frontend only while a worker is idle
           (poll_timeout_ms, also the shutdown latency)
        2. backend:  READY registers/re-queues the worker; a reply completes
                     its pending dispatch, re-queues the worker and is
                     relayed to the client (non-JSON replies are replaced by
                     an {"error": ...} payload)
        3. frontend: while a client message waits AND a worker is idle, pop
                     the front worker and forward [client, "", payload]
        4. maintenance: deduplicate the idle queue, log statistics

        While no worker is idle, client bytes stay in the kernel socket
        buffers; what was read while one was idle stays queued. There are no
        deadlines on dispatched requests and no worker eviction.

    Thread Safety:
        Only the loop thread touches endpoints and the pool. The counters
        exposed for monitoring are atomics refreshed by the loop.
*******************************************************************************/

#ifndef BROKER_H
#define BROKER_H

#include "broker/worker_pool.h"
#include "net/router.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace roomalloc {

struct BrokerConfig {
    uint16_t frontend_port = 5555;
    uint16_t backend_port = 5556;
    int poll_timeout_ms = 100;
    int dedup_interval_ms = 1000;
    int stats_interval_sec = 5;
    int send_timeout_ms = 5000;
};

class Broker {
private:
    BrokerConfig config_;
    net::RouterEndpoint frontend_;
    net::RouterEndpoint backend_;
    WorkerPool pool_;

    std::atomic<bool> running_;
    std::thread loop_thread_;

    std::atomic<size_t> registered_workers_;
    std::atomic<size_t> idle_workers_;
    std::atomic<size_t> in_flight_;
    std::atomic<size_t> connected_clients_;
    std::atomic<size_t> queued_requests_;
    std::atomic<uint64_t> requests_dispatched_;
    std::atomic<uint64_t> replies_relayed_;

    std::chrono::steady_clock::time_point last_dedup_;
    std::chrono::steady_clock::time_point last_stats_;

    void event_loop();
    void handle_backend();
    void dispatch_pending();
    void run_maintenance();
    void relay_reply(const std::string& worker, const Multipart& frames);
    void publish_counters();

public:
    explicit Broker(const BrokerConfig& config);
    ~Broker();

    bool start();
    void stop();
    bool is_running() const { return running_; }

    size_t registered_workers() const { return registered_workers_; }
    size_t idle_workers() const { return idle_workers_; }
    size_t in_flight() const { return in_flight_; }
    size_t connected_clients() const { return connected_clients_; }
    size_t queued_requests() const { return queued_requests_; }
    uint64_t requests_dispatched() const { return requests_dispatched_; }
    uint64_t replies_relayed() const { return replies_relayed_; }

    void log_statistics() const;
};

} // namespace roomalloc

#endif // BROKER_H
