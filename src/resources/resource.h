/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: resource.h

    Description:
        The allocatable unit of the service. A Resource is a fixed room, a
        lab, or a mobile room (a fixed room temporarily standing in for a
        lab). Identity is a stable string taken from the durable resource
        file; resources are never created or deleted while a worker runs.

    Invariants:
        - status == ASSIGNED  <=>  requester/program/requested_at/assigned_at
          are all non-empty
        - kind == MOBILE_ROOM only for a former FIXED_ROOM; a system reset
          turns it back into FIXED_ROOM
        - capacity > 0
*******************************************************************************/

#ifndef RESOURCE_H
#define RESOURCE_H

#include <string>
#include <vector>

namespace roomalloc {

enum class ResourceKind {
    FIXED_ROOM,
    LAB,
    MOBILE_ROOM
};

enum class ResourceStatus {
    AVAILABLE,
    ASSIGNED
};

struct Resource {
    std::string id;
    ResourceKind kind;
    ResourceStatus status;
    int capacity;

    // Assignment context, empty while AVAILABLE
    std::string requester;
    std::string program;
    std::string requested_at;
    std::string assigned_at;

    Resource() : kind(ResourceKind::FIXED_ROOM),
                 status(ResourceStatus::AVAILABLE),
                 capacity(0) {}

    Resource(const std::string& resource_id, ResourceKind resource_kind, int seats)
        : id(resource_id), kind(resource_kind),
          status(ResourceStatus::AVAILABLE), capacity(seats) {}

    bool is_available() const { return status == ResourceStatus::AVAILABLE; }

    // Checks the status/context invariant and the capacity bound.
    bool is_consistent() const;

    void assign(const std::string& to_requester, const std::string& to_program,
                const std::string& timestamp);

    // Back to AVAILABLE with an empty context; MOBILE_ROOM reverts to FIXED_ROOM.
    void release();

    bool operator==(const Resource& other) const;
    bool operator!=(const Resource& other) const { return !(*this == other); }
};

// Durable/wire spellings: "room", "lab", "mobile_room"
std::string kind_to_string(ResourceKind kind);
// Throws ValidationError on an unknown spelling.
ResourceKind kind_from_string(const std::string& text);

// Durable/wire spellings: "available", "assigned"
std::string status_to_string(ResourceStatus status);
// Throws ValidationError on an unknown spelling.
ResourceStatus status_from_string(const std::string& text);

} // namespace roomalloc

#endif // RESOURCE_H
