//
// Created by Sanger Steel on 6/14/25.
//

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shared flag handed to every in-flight request of a run. The transport
// polls it (libcurl progress callback) and aborts the transfer once set.
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mu);
            cancelled_.store(true, std::memory_order_release);
        }
        cv.notify_all();
    }

    bool cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Sleeps for `duration` unless cancelled first. Returns true if the full
    // duration elapsed.
    template<typename Rep, typename Period>
    bool sleep_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(mu);
        return !cv.wait_for(lock, duration, [this] { return cancelled(); });
    }

private:
    std::atomic<bool> cancelled_ = false;
    mutable std::mutex mu;
    mutable std::condition_variable cv;
};
