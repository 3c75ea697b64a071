/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: resource_table.h

    Description:
        In-memory resource table of an allocator worker with its durable CSV
        backing. The table is an arena (vector with stable indices, never
        shrunk) plus an id index, guarded by one mutex. That mutex is the only
        thing that prevents two concurrent requests from taking the same room:
        allocate() holds it across scan, mutation, durable rewrite and reply
        construction.

        Concurrency Model:
        - One std::mutex for the whole table, no per-row locks
        - allocate()/reset_all()/apply_snapshot() are mutually exclusive
        - snapshot()/stats()/find() take the same lock and return copies

        Persistence:
        - Every successful mutation rewrites the whole file (ResourceStore)
        - allocate()/reset_all(): if the rewrite fails the touched rows are
          restored and PersistenceError propagates; the table never holds a
          mutation that is not on disk
        - apply_snapshot(): the merged rows stay in memory even if the
          optional rewrite fails (the snapshot is the authority there)

    Related Files:
        - resources/allocation.h: the matching rule
        - resources/resource_store.h: CSV format
*******************************************************************************/

#ifndef RESOURCE_TABLE_H
#define RESOURCE_TABLE_H

#include "common/protocol.h"
#include "resources/resource.h"
#include "resources/resource_store.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace roomalloc {

struct TableStats {
    int total_rooms;
    int available_rooms;
    int total_labs;
    int available_labs;
    int mobile_rooms;

    TableStats() : total_rooms(0), available_rooms(0), total_labs(0),
                   available_labs(0), mobile_rooms(0) {}

    std::string to_string() const;
};

class ResourceTable {
private:
    std::vector<Resource> resources_;
    std::map<std::string, size_t> index_;
    mutable std::mutex mutex_;
    ResourceStore store_;

    void persist_locked() const;

public:
    explicit ResourceTable(const std::string& path);

    ResourceTable(const ResourceTable&) = delete;
    ResourceTable& operator=(const ResourceTable&) = delete;

    const std::string& path() const { return store_.path(); }

    // Replaces the contents with the durable file. Throws PersistenceError.
    size_t load();

    std::vector<Resource> snapshot() const;

    // Per-resource upsert: existing ids overwritten field for field, unseen
    // ids appended, ids absent from `resources` kept. Returns the number of
    // rows that changed. Throws PersistenceError only when `persist` is set
    // and the rewrite fails.
    size_t apply_snapshot(const std::vector<Resource>& resources, bool persist);

    // SUCCESS or UNAVAILABLE; throws PersistenceError.
    AllocationResponse allocate(const AllocationRequest& request);
    AllocationResponse allocate(const AllocationRequest& request,
                                const std::string& timestamp);

    // Every resource back to AVAILABLE, mobile rooms back to fixed rooms.
    void reset_all();

    TableStats stats() const;

    bool find(const std::string& id, Resource& out) const;

    size_t size() const;
};

} // namespace roomalloc

#endif // RESOURCE_TABLE_H
