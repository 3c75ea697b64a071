/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: allocation.cpp
*******************************************************************************/

#include "resources/allocation.h"

#include <algorithm>

namespace roomalloc {

static bool fits(const Resource& r, ResourceKind kind, int min_capacity) {
    return r.kind == kind && r.is_available() && r.capacity >= min_capacity;
}

AllocationPlan plan_allocation(const std::vector<Resource>& resources,
                               const AllocationRequest& request) {
    AllocationPlan plan;

    std::vector<size_t> free_rooms;
    std::vector<size_t> free_labs;
    for (size_t i = 0; i < resources.size(); ++i) {
        if (fits(resources[i], ResourceKind::FIXED_ROOM, request.min_capacity)) {
            free_rooms.push_back(i);
        } else if (fits(resources[i], ResourceKind::LAB, request.min_capacity)) {
            free_labs.push_back(i);
        }
    }

    size_t rooms_wanted = static_cast<size_t>(request.rooms_requested);
    size_t labs_wanted = static_cast<size_t>(request.labs_requested);

    if (free_rooms.size() < rooms_wanted) {
        plan.reason = "Insufficient rooms: requested " + std::to_string(rooms_wanted) +
                      ", available " + std::to_string(free_rooms.size());
        return plan;
    }

    size_t convertible = free_rooms.size() - rooms_wanted;
    if (free_labs.size() + convertible < labs_wanted) {
        plan.reason = "Insufficient labs: requested " + std::to_string(labs_wanted) +
                      ", available " + std::to_string(free_labs.size()) +
                      " labs and " + std::to_string(convertible) +
                      " convertible rooms";
        return plan;
    }

    plan.rooms.assign(free_rooms.begin(), free_rooms.begin() + rooms_wanted);

    size_t direct_labs = std::min(labs_wanted, free_labs.size());
    plan.labs.assign(free_labs.begin(), free_labs.begin() + direct_labs);

    size_t shortfall = labs_wanted - direct_labs;
    plan.conversions.assign(free_rooms.begin() + rooms_wanted,
                            free_rooms.begin() + rooms_wanted + shortfall);

    plan.feasible = true;
    return plan;
}

AllocationResponse apply_plan(std::vector<Resource>& resources,
                              const AllocationPlan& plan,
                              const AllocationRequest& request,
                              const std::string& timestamp) {
    AllocationResponse response;
    response.kind = ResponseKind::SUCCESS;
    response.requester = request.requester;
    response.program = request.program;
    response.term = request.term;

    for (size_t idx : plan.rooms) {
        resources[idx].assign(request.requester, request.program, timestamp);
        response.rooms_assigned.push_back(resources[idx].id);
    }
    for (size_t idx : plan.labs) {
        resources[idx].assign(request.requester, request.program, timestamp);
        response.labs_assigned.push_back(resources[idx].id);
    }
    for (size_t idx : plan.conversions) {
        resources[idx].kind = ResourceKind::MOBILE_ROOM;
        resources[idx].assign(request.requester, request.program, timestamp);
        response.labs_assigned.push_back(resources[idx].id);
    }

    if (!plan.conversions.empty()) {
        response.notice = conversion_notice(plan.conversions.size());
    }
    return response;
}

std::string conversion_notice(size_t converted) {
    return "Converted " + std::to_string(converted) +
           (converted == 1 ? " room" : " rooms") +
           " into mobile rooms due to lab shortage";
}

} // namespace roomalloc
