/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: resource_table.cpp
*******************************************************************************/

#include "resources/resource_table.h"
#include "resources/allocation.h"
#include "common/errors.h"
#include "common/logger.h"

#include <sstream>

namespace roomalloc {

std::string TableStats::to_string() const {
    std::stringstream ss;
    ss << "rooms " << available_rooms << "/" << total_rooms << " available, "
       << "labs " << available_labs << "/" << total_labs << " available, "
       << mobile_rooms << " mobile rooms in use";
    return ss.str();
}

ResourceTable::ResourceTable(const std::string& path) : store_(path) {
}

void ResourceTable::persist_locked() const {
    store_.save(resources_);
}

size_t ResourceTable::load() {
    auto loaded = store_.load();

    std::lock_guard<std::mutex> lock(mutex_);
    resources_ = std::move(loaded);
    index_.clear();
    for (size_t i = 0; i < resources_.size(); ++i) {
        index_[resources_[i].id] = i;
    }
    return resources_.size();
}

std::vector<Resource> ResourceTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_;
}

size_t ResourceTable::apply_snapshot(const std::vector<Resource>& resources, bool persist) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t changed = 0;
    for (const auto& incoming : resources) {
        auto it = index_.find(incoming.id);
        if (it == index_.end()) {
            index_[incoming.id] = resources_.size();
            resources_.push_back(incoming);
            changed++;
        } else if (resources_[it->second] != incoming) {
            resources_[it->second] = incoming;
            changed++;
        }
    }

    if (persist && changed > 0) {
        persist_locked();
    }
    return changed;
}

AllocationResponse ResourceTable::allocate(const AllocationRequest& request) {
    return allocate(request, iso8601_now());
}

AllocationResponse ResourceTable::allocate(const AllocationRequest& request,
                                           const std::string& timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);

    AllocationPlan plan = plan_allocation(resources_, request);
    if (!plan.feasible) {
        Logger::info("Request from " + request.requester + " - " + request.program +
                     " rejected: " + plan.reason);
        return AllocationResponse::unavailable(plan.reason);
    }

    // Rows as they were, in case the durable rewrite fails
    std::vector<std::pair<size_t, Resource>> before;
    for (const auto* group : {&plan.rooms, &plan.labs, &plan.conversions}) {
        for (size_t idx : *group) {
            before.emplace_back(idx, resources_[idx]);
        }
    }

    AllocationResponse response = apply_plan(resources_, plan, request, timestamp);

    try {
        persist_locked();
    } catch (const PersistenceError& e) {
        for (auto& [idx, row] : before) {
            resources_[idx] = row;
        }
        Logger::error("Allocation for " + request.requester + " - " + request.program +
                      " rolled back: " + e.what());
        throw;
    }

    Logger::info("Assigned " + std::to_string(response.rooms_assigned.size()) +
                 " rooms and " + std::to_string(response.labs_assigned.size()) +
                 " labs to " + request.requester + " - " + request.program);
    if (!response.notice.empty()) {
        Logger::info(response.notice);
    }
    return response;
}

void ResourceTable::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Resource> before = resources_;
    for (auto& r : resources_) {
        r.release();
    }

    try {
        persist_locked();
    } catch (const PersistenceError& e) {
        resources_ = before;
        Logger::error(std::string("System reset rolled back: ") + e.what());
        throw;
    }
    Logger::info("System reset: " + std::to_string(resources_.size()) +
                 " resources available");
}

TableStats ResourceTable::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    TableStats stats;
    for (const auto& r : resources_) {
        switch (r.kind) {
            case ResourceKind::FIXED_ROOM:
                stats.total_rooms++;
                if (r.is_available()) stats.available_rooms++;
                break;
            case ResourceKind::LAB:
                stats.total_labs++;
                if (r.is_available()) stats.available_labs++;
                break;
            case ResourceKind::MOBILE_ROOM:
                // still counted as a room: it reverts on reset
                stats.total_rooms++;
                stats.mobile_rooms++;
                break;
        }
    }
    return stats;
}

bool ResourceTable::find(const std::string& id, Resource& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    out = resources_[it->second];
    return true;
}

size_t ResourceTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_.size();
}

} // namespace roomalloc
