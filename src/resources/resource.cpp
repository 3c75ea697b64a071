/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: resource.cpp

    Description:
        Resource state transitions and the string spellings used by the CSV
        store and the state-sync snapshot.
*******************************************************************************/

#include "resources/resource.h"
#include "common/errors.h"

namespace roomalloc {

bool Resource::is_consistent() const {
    if (id.empty() || capacity <= 0) {
        return false;
    }

    bool has_context = !requester.empty() && !program.empty() &&
                       !requested_at.empty() && !assigned_at.empty();
    bool empty_context = requester.empty() && program.empty() &&
                         requested_at.empty() && assigned_at.empty();

    if (status == ResourceStatus::ASSIGNED) {
        return has_context;
    }
    // A mobile room only exists while assigned
    return empty_context && kind != ResourceKind::MOBILE_ROOM;
}

void Resource::assign(const std::string& to_requester, const std::string& to_program,
                      const std::string& timestamp) {
    status = ResourceStatus::ASSIGNED;
    requester = to_requester;
    program = to_program;
    requested_at = timestamp;
    assigned_at = timestamp;
}

void Resource::release() {
    status = ResourceStatus::AVAILABLE;
    requester.clear();
    program.clear();
    requested_at.clear();
    assigned_at.clear();
    if (kind == ResourceKind::MOBILE_ROOM) {
        kind = ResourceKind::FIXED_ROOM;
    }
}

bool Resource::operator==(const Resource& other) const {
    return id == other.id &&
           kind == other.kind &&
           status == other.status &&
           capacity == other.capacity &&
           requester == other.requester &&
           program == other.program &&
           requested_at == other.requested_at &&
           assigned_at == other.assigned_at;
}

std::string kind_to_string(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::FIXED_ROOM:
            return "room";
        case ResourceKind::LAB:
            return "lab";
        case ResourceKind::MOBILE_ROOM:
            return "mobile_room";
    }
    return "room";
}

ResourceKind kind_from_string(const std::string& text) {
    if (text == "room") return ResourceKind::FIXED_ROOM;
    if (text == "lab") return ResourceKind::LAB;
    if (text == "mobile_room") return ResourceKind::MOBILE_ROOM;
    throw ValidationError("Unknown resource kind: '" + text + "'");
}

std::string status_to_string(ResourceStatus status) {
    return status == ResourceStatus::ASSIGNED ? "assigned" : "available";
}

ResourceStatus status_from_string(const std::string& text) {
    if (text == "available") return ResourceStatus::AVAILABLE;
    if (text == "assigned") return ResourceStatus::ASSIGNED;
    throw ValidationError("Unknown resource status: '" + text + "'");
}

} // namespace roomalloc
