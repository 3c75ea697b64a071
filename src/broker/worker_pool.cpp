/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: worker_pool.cpp
*******************************************************************************/

#include "broker/worker_pool.h"

#include <algorithm>
#include <stdexcept>

namespace roomalloc {

std::string worker_state_to_string(WorkerState state) {
    switch (state) {
        case WorkerState::UNKNOWN: return "UNKNOWN";
        case WorkerState::REGISTERED: return "REGISTERED";
        case WorkerState::IDLE: return "IDLE";
        case WorkerState::BUSY: return "BUSY";
    }
    return "UNKNOWN";
}

bool WorkerPool::is_idle(const std::string& worker) const {
    return std::find(idle_.begin(), idle_.end(), worker) != idle_.end();
}

bool WorkerPool::register_worker(const std::string& worker) {
    bool first_time = registered_.insert(worker).second;
    mark_idle(worker);
    return first_time;
}

std::string WorkerPool::next_worker() {
    if (idle_.empty()) {
        throw std::logic_error("next_worker() with no idle worker");
    }
    std::string worker = idle_.front();
    idle_.pop_front();
    return worker;
}

void WorkerPool::mark_idle(const std::string& worker) {
    registered_.insert(worker);
    if (!is_idle(worker)) {
        idle_.push_back(worker);
    }
}

size_t WorkerPool::dedup_idle() {
    std::set<std::string> seen;
    std::deque<std::string> unique;
    for (const auto& worker : idle_) {
        if (seen.insert(worker).second) {
            unique.push_back(worker);
        }
    }
    size_t removed = idle_.size() - unique.size();
    idle_.swap(unique);
    return removed;
}

void WorkerPool::record_dispatch(const std::string& client, const std::string& worker) {
    pending_.emplace(client, worker);
}

bool WorkerPool::complete_dispatch(const std::string& client, const std::string& worker) {
    auto range = pending_.equal_range(client);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second == worker) {
            pending_.erase(it);
            return true;
        }
    }
    return false;
}

WorkerState WorkerPool::state_of(const std::string& worker) const {
    if (registered_.count(worker) == 0) {
        return WorkerState::UNKNOWN;
    }
    if (is_idle(worker)) {
        return WorkerState::IDLE;
    }
    for (const auto& [client, w] : pending_) {
        if (w == worker) {
            return WorkerState::BUSY;
        }
    }
    return WorkerState::REGISTERED;
}

size_t WorkerPool::waiting_clients() const {
    std::set<std::string> clients;
    for (const auto& [client, worker] : pending_) {
        clients.insert(client);
    }
    return clients.size();
}

std::vector<std::string> WorkerPool::idle_order() const {
    return std::vector<std::string>(idle_.begin(), idle_.end());
}

} // namespace roomalloc
