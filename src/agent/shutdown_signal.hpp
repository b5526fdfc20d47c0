#ifndef SHUTDOWN_SIGNAL_HPP
#define SHUTDOWN_SIGNAL_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

// One-shot flag that wakes every thread sleeping in waitFor().
// Used to cut retry backoff and ticker sleeps short on close().
class ShutdownSignal {
public:
    void trigger() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            triggered_ = true;
        }
        cv_.notify_all();
    }

    // Sleep up to duration. Returns true if the signal fired.
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return triggered_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool triggered_ = false;
};

#endif // SHUTDOWN_SIGNAL_HPP
