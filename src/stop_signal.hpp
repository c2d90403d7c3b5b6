#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace kindling {

// One-shot cancellation token shared by a controller and its worker threads.
// request() is idempotent; sleeping workers wake immediately.
class StopSignal {
public:
    void request() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_.store(true);
        }
        cv_.notify_all();
    }

    bool requested() const { return stopped_.load(); }

    // Flag handed to HttpClient so in-flight transfers abort too.
    const std::atomic<bool>* flag() const { return &stopped_; }

    // Sleep up to duration. Returns true if stop was requested.
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return stopped_.load(); });
    }

private:
    std::atomic<bool> stopped_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace kindling
