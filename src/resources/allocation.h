/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: allocation.h

    Description:
        The resource-matching rule, split into a pure planning step and an
        apply step so that a rejected request provably touches nothing.

        Rule:
        1. rooms_requested fixed rooms are taken from the AVAILABLE fixed
           rooms (table order, capacity >= min_capacity)
        2. labs_requested labs are taken from the AVAILABLE labs
        3. a lab shortfall is covered by converting further AVAILABLE fixed
           rooms (not used in step 1) into mobile rooms; they are reported
           among the assigned labs and the response carries a notice
        4. if step 1 or steps 2+3 cannot be satisfied the plan is infeasible

        Both functions operate on the table arena by index and must be called
        with the table lock held.
*******************************************************************************/

#ifndef ALLOCATION_H
#define ALLOCATION_H

#include "common/protocol.h"
#include "resources/resource.h"

#include <string>
#include <vector>

namespace roomalloc {

struct AllocationPlan {
    bool feasible;
    std::string reason;               // set when !feasible

    std::vector<size_t> rooms;        // fixed rooms to assign
    std::vector<size_t> labs;         // labs to assign
    std::vector<size_t> conversions;  // fixed rooms to turn into mobile rooms

    AllocationPlan() : feasible(false) {}
};

AllocationPlan plan_allocation(const std::vector<Resource>& resources,
                               const AllocationRequest& request);

// Mutates the planned rows and builds the SUCCESS response.
AllocationResponse apply_plan(std::vector<Resource>& resources,
                              const AllocationPlan& plan,
                              const AllocationRequest& request,
                              const std::string& timestamp);

std::string conversion_notice(size_t converted);

} // namespace roomalloc

#endif // ALLOCATION_H
