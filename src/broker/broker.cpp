/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: broker.cpp
*******************************************************************************/

#include "broker/broker.h"
#include "common/logger.h"
#include "common/message.h"
#include "common/protocol.h"

namespace roomalloc {

Broker::Broker(const BrokerConfig& config)
    : config_(config),
      frontend_("frontend", config.send_timeout_ms),
      backend_("backend", config.send_timeout_ms),
      running_(false),
      registered_workers_(0),
      idle_workers_(0),
      in_flight_(0),
      connected_clients_(0),
      queued_requests_(0),
      requests_dispatched_(0),
      replies_relayed_(0) {
}

Broker::~Broker() {
    stop();
}

bool Broker::start() {
    if (running_) {
        Logger::warning("Broker already running");
        return false;
    }

    Logger::info("Starting broker (frontend " + std::to_string(config_.frontend_port) +
                 ", backend " + std::to_string(config_.backend_port) + ")");

    if (!frontend_.bind(config_.frontend_port)) {
        Logger::error("Failed to bind client frontend");
        return false;
    }
    if (!backend_.bind(config_.backend_port)) {
        Logger::error("Failed to bind worker backend");
        frontend_.close();
        return false;
    }

    last_dedup_ = std::chrono::steady_clock::now();
    last_stats_ = last_dedup_;

    running_ = true;
    loop_thread_ = std::thread(&Broker::event_loop, this);

    Logger::info("Broker started successfully");
    return true;
}

void Broker::stop() {
    if (!running_) return;

    Logger::info("Stopping broker...");
    running_ = false;
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    frontend_.close();
    backend_.close();
    Logger::info("Broker stopped");
}

void Broker::event_loop() {
    Logger::info("Broker event loop started");

    while (running_) {
        try {
            // Client bytes stay in the socket buffers until a worker can take them
            std::vector<net::RouterEndpoint*> endpoints{&backend_};
            if (pool_.has_idle()) {
                endpoints.push_back(&frontend_);
            }
            net::RouterEndpoint::poll(endpoints, config_.poll_timeout_ms);
            handle_backend();
            dispatch_pending();
            run_maintenance();
        } catch (const std::exception& e) {
            Logger::error("Exception in broker loop: " + std::string(e.what()));
        }
        publish_counters();
    }

    Logger::info("Broker event loop stopped");
}

void Broker::handle_backend() {
    net::RoutedMessage msg;
    while (backend_.pop(msg)) {
        const std::string& worker = msg.address;

        if (is_ready_signal(msg.frames)) {
            if (pool_.register_worker(worker)) {
                Logger::info("Worker " + worker + " registered (" +
                             std::to_string(pool_.registered_count()) + " total)");
            } else {
                Logger::debug("Worker " + worker + " ready");
            }
            continue;
        }

        if (msg.frames.size() == 3 && msg.frames[1].empty()) {
            relay_reply(worker, msg.frames);
            continue;
        }

        Logger::warning("Discarding malformed message from worker " + worker +
                        ": " + describe(msg.frames));
    }
}

void Broker::relay_reply(const std::string& worker, const Multipart& frames) {
    const std::string& client = frames[0];
    std::string payload = frames[2];

    if (!pool_.complete_dispatch(client, worker)) {
        Logger::warning("Reply from " + worker + " for " + client +
                        " matches no pending dispatch");
    }
    pool_.mark_idle(worker);

    if (!is_valid_json(payload)) {
        Logger::warning("Worker " + worker + " sent a reply that is not JSON");
        payload = error_payload("Invalid response from worker");
    }

    if (!frontend_.send(client, make_client_envelope(payload))) {
        Logger::warning("Client " + client + " is gone, reply from " + worker + " dropped");
        return;
    }

    replies_relayed_++;
    std::string label = request_label(payload);
    Logger::info("Reply " + (label.empty() ? std::string("") : label + " ") +
                 "relayed " + worker + " -> " + client);
}

void Broker::dispatch_pending() {
    net::RoutedMessage msg;
    while (frontend_.has_pending() && pool_.has_idle()) {
        frontend_.pop(msg);
        const std::string& client = msg.address;

        if (msg.frames.size() != 2 || !msg.frames[0].empty()) {
            Logger::warning("Malformed request envelope from " + client + ": " +
                            describe(msg.frames));
            if (!frontend_.send(client, make_client_envelope(
                    error_payload("Malformed request envelope")))) {
                Logger::debug("Client " + client + " is gone");
            }
            continue;
        }

        const std::string& payload = msg.frames[1];
        std::string worker = pool_.next_worker();

        if (!backend_.send(worker, make_worker_envelope(client, payload))) {
            // The worker stays registered but leaves the idle queue
            Logger::warning("Dispatch to " + worker + " failed, request requeued");
            frontend_.requeue_front(msg);
            continue;
        }

        pool_.record_dispatch(client, worker);
        requests_dispatched_++;

        std::string label = request_label(payload);
        Logger::info("Request " + (label.empty() ? client : label) +
                     " dispatched " + client + " -> " + worker);
    }
}

void Broker::run_maintenance() {
    auto now = std::chrono::steady_clock::now();

    if (now - last_dedup_ >= std::chrono::milliseconds(config_.dedup_interval_ms)) {
        size_t removed = pool_.dedup_idle();
        if (removed > 0) {
            Logger::warning("Removed " + std::to_string(removed) +
                            " duplicate idle queue entries");
        }
        last_dedup_ = now;
    }

    if (config_.stats_interval_sec > 0 &&
        now - last_stats_ >= std::chrono::seconds(config_.stats_interval_sec)) {
        log_statistics();
        last_stats_ = now;
    }
}

void Broker::publish_counters() {
    registered_workers_ = pool_.registered_count();
    idle_workers_ = pool_.idle_count();
    in_flight_ = pool_.in_flight();
    connected_clients_ = frontend_.peer_count();
    queued_requests_ = frontend_.pending();
}

void Broker::log_statistics() const {
    Logger::info("Broker stats: " + std::to_string(connected_clients_.load()) +
                 " clients connected, " + std::to_string(queued_requests_.load()) +
                 " requests queued, workers " + std::to_string(registered_workers_.load()) +
                 " registered / " + std::to_string(idle_workers_.load()) + " idle, " +
                 std::to_string(in_flight_.load()) + " in flight, " +
                 std::to_string(requests_dispatched_.load()) + " dispatched, " +
                 std::to_string(replies_relayed_.load()) + " relayed");
}

} // namespace roomalloc
