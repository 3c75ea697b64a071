/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: worker.cpp
*******************************************************************************/

#include "worker/worker.h"
#include "common/logger.h"
#include "common/message.h"

#include <unistd.h>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace roomalloc {

AllocatorWorker::AllocatorWorker(const WorkerConfig& config, ResourceTable& table)
    : AllocatorWorker(config,
                      with_request_logging(
                          with_table_stats(make_table_handler(table), table))) {
}

AllocatorWorker::AllocatorWorker(const WorkerConfig& config, RequestHandler handler)
    : config_(config),
      handler_(std::move(handler)),
      permits_(config.max_concurrent_requests > 0 ? config.max_concurrent_requests : 1),
      running_(false),
      in_flight_(0),
      peak_in_flight_(0),
      processed_(0),
      request_threads_(0) {
    if (config_.identity.empty()) {
        config_.identity = generate_identity("worker");
    }
}

AllocatorWorker::~AllocatorWorker() {
    stop();
}

std::string AllocatorWorker::generate_identity(const std::string& prefix) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dist;

    std::stringstream ss;
    ss << prefix << "-" << getpid() << "-" << std::hex << std::setw(8)
       << std::setfill('0') << dist(gen);
    return ss.str();
}

bool AllocatorWorker::start() {
    if (running_) {
        Logger::warning("Worker already running");
        return false;
    }

    Logger::info("Starting worker " + config_.identity + " (broker " +
                 config_.broker_host + ":" + std::to_string(config_.broker_port) +
                 ", " + std::to_string(permits_.capacity()) + " concurrent requests)");

    if (!connection_.connect(config_.broker_host, config_.broker_port,
                             config_.identity, config_.send_timeout_ms)) {
        Logger::error("Failed to connect to broker");
        return false;
    }

    if (!send_ready()) {
        Logger::error("Failed to register with broker");
        connection_.close();
        return false;
    }

    running_ = true;
    dispatch_thread_ = std::thread(&AllocatorWorker::dispatch_loop, this);

    Logger::info("Worker " + config_.identity + " registered with broker");
    return true;
}

void AllocatorWorker::stop() {
    if (!running_ && !dispatch_thread_.joinable()) return;

    Logger::info("Stopping worker " + config_.identity + "...");
    running_ = false;
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }

    {
        std::unique_lock<std::mutex> lock(drain_mutex_);
        drain_cv_.wait(lock, [this] { return request_threads_ == 0; });
    }

    connection_.close();
    Logger::info("Worker " + config_.identity + " stopped (" +
                 std::to_string(processed_.load()) + " requests processed)");
}

bool AllocatorWorker::send_ready() {
    return connection_.send(Multipart{READY_SIGNAL});
}

void AllocatorWorker::dispatch_loop() {
    Logger::info("Dispatch loop started");

    while (running_) {
        if (!permits_.acquire_for(config_.poll_timeout_ms)) {
            continue;
        }

        Multipart frames;
        if (!connection_.receive(frames, config_.poll_timeout_ms)) {
            permits_.release();
            if (!connection_.connected()) {
                Logger::error("Lost connection to broker");
                running_ = false;
                break;
            }
            continue;
        }

        if (frames.size() != 3 || !frames[1].empty()) {
            Logger::warning("Discarding malformed dispatch: " + describe(frames));
            permits_.release();
            if (!send_ready()) {
                Logger::warning("Failed to send READY");
            }
            continue;
        }

        int now_in_flight = ++in_flight_;
        int peak = peak_in_flight_;
        while (now_in_flight > peak &&
               !peak_in_flight_.compare_exchange_weak(peak, now_in_flight)) {
        }

        {
            std::lock_guard<std::mutex> lock(drain_mutex_);
            request_threads_++;
        }
        std::thread(&AllocatorWorker::handle_request, this, frames[0], frames[2]).detach();

        // Still room for more: tell the broker right away
        if (permits_.available() > 0 && !send_ready()) {
            Logger::warning("Failed to send READY");
        }
    }

    Logger::info("Dispatch loop stopped");
}

void AllocatorWorker::handle_request(std::string client, std::string payload) {
    try {
        std::string reply = process_payload(handler_, payload);
        if (!connection_.send(make_worker_envelope(client, reply))) {
            Logger::error("Failed to send reply to " + client);
        }
    } catch (const std::exception& e) {
        Logger::error("Request thread for " + client + " failed: " + e.what());
        if (!connection_.send(make_worker_envelope(client, error_payload("Internal error")))) {
            Logger::error("Failed to send error reply to " + client);
        }
    }

    processed_++;
    in_flight_--;
    permits_.release();
    if (!send_ready()) {
        Logger::warning("Failed to send READY after reply to " + client);
    }

    // Last touch of this object: stop() may destroy it once the count is 0
    std::lock_guard<std::mutex> lock(drain_mutex_);
    request_threads_--;
    drain_cv_.notify_all();
}

} // namespace roomalloc
