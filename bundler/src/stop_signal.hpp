#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

// Interruptible sleep shared by background loops and retry backoffs.
class StopSignal {
public:
    // Returns true when stop was requested, or the wait was interrupted,
    // before the timeout elapsed.
    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        const uint64_t generation = generation_;
        return cv_.wait_for(lock, timeout, [this, generation] {
            return stopped_ || generation_ != generation;
        });
    }

    // Sticky until reset(): every later wait returns immediately.
    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
            generation_++;
        }
        cv_.notify_all();
    }

    // Wakes the waits already in progress; later waits sleep normally.
    void interrupt() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            generation_++;
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }

    bool stop_requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
    uint64_t generation_ = 0;
};
