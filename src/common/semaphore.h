/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: semaphore.h

    Description:
        Counting semaphore used as the admission gate of an allocator worker.
        A permit is held for the whole life of one request (receive, process,
        reply); the dispatch loop only pulls a message off the broker
        connection while it holds one.

        acquire_for() waits at most the given time so the owning loop can
        still notice a stop request.
*******************************************************************************/

#ifndef SEMAPHORE_H
#define SEMAPHORE_H

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace roomalloc {

class CountingSemaphore {
private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int permits_;
    const int capacity_;

public:
    explicit CountingSemaphore(int permits)
        : permits_(permits), capacity_(permits) {}

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (permits_ == 0) return false;
        permits_--;
        return true;
    }

    bool acquire_for(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                          [this] { return permits_ > 0; })) {
            return false;
        }
        permits_--;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (permits_ < capacity_) permits_++;
        }
        cv_.notify_one();
    }

    int available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return permits_;
    }

    int capacity() const { return capacity_; }
};

} // namespace roomalloc

#endif // SEMAPHORE_H
