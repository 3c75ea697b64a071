/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: worker_pool.h

    Description:
        Routing metadata of the load-balancing broker: which workers have
        registered, which of them are idle (in FIFO order), and which client
        is waiting on which worker.

        Membership:
            REGISTERED  seen at least once, currently neither idle nor busy
            IDLE        in the idle queue, eligible for the next dispatch
            BUSY        holds at least one pending dispatch

        Workers are never removed: there is no eviction of a worker that
        stops replying. It simply never returns to the idle queue.

    Threading:
        Not thread-safe; owned by the broker's event loop.
*******************************************************************************/

#ifndef WORKER_POOL_H
#define WORKER_POOL_H

#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace roomalloc {

enum class WorkerState {
    UNKNOWN,
    REGISTERED,
    IDLE,
    BUSY
};

std::string worker_state_to_string(WorkerState state);

class WorkerPool {
private:
    std::set<std::string> registered_;
    std::deque<std::string> idle_;
    // (client, worker) pairs of dispatched requests awaiting a reply
    std::multimap<std::string, std::string> pending_;

    bool is_idle(const std::string& worker) const;

public:
    // Adds the worker to the registered set and, unless it is already
    // queued, to the back of the idle queue. Returns true for a first-time
    // registration.
    bool register_worker(const std::string& worker);

    bool has_idle() const { return !idle_.empty(); }

    // Pops the front of the idle queue. Requires has_idle().
    std::string next_worker();

    // Back of the idle queue unless already queued.
    void mark_idle(const std::string& worker);

    // Removes repeated idle entries, keeping the first. Returns the number
    // removed.
    size_t dedup_idle();

    void record_dispatch(const std::string& client, const std::string& worker);

    // Removes one (client, worker) pending entry. false if none matched.
    bool complete_dispatch(const std::string& client, const std::string& worker);

    WorkerState state_of(const std::string& worker) const;

    size_t registered_count() const { return registered_.size(); }
    size_t idle_count() const { return idle_.size(); }
    size_t in_flight() const { return pending_.size(); }
    size_t waiting_clients() const;

    std::vector<std::string> idle_order() const;
};

} // namespace roomalloc

#endif // WORKER_POOL_H
