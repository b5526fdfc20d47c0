#ifndef DELIVERY_WORKER_HPP
#define DELIVERY_WORKER_HPP

#include "../transport/delivery_port.hpp"
#include "log_queue.hpp"
#include "pipeline_stats.hpp"
#include "retry_strategy.hpp"
#include "shutdown_signal.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

// One delivery thread. Polls the shared queue, serializes each entry and
// ships it through the port under the retry strategy. A failed entry is
// counted and dropped; the loop never dies on a delivery error.
class DeliveryWorker {
public:
    DeliveryWorker(int worker_id,
                   LogQueue& queue,
                   DeliveryPort& port,
                   const RetryStrategy& retry,
                   PipelineCounters& counters,
                   ShutdownSignal& shutdown,
                   bool failsafe,
                   std::chrono::milliseconds poll_interval);
    ~DeliveryWorker();

    DeliveryWorker(const DeliveryWorker&) = delete;
    DeliveryWorker& operator=(const DeliveryWorker&) = delete;

    void start();

    // Ask the loop to exit after the entry in hand
    void signalStop();

    // Wait for the thread to exit (with timeout)
    // Returns true if stopped cleanly, false if timeout
    bool waitForStop(std::chrono::milliseconds timeout);

    // Join unconditionally. Only safe once the port has been closed or the
    // loop is known to be exiting.
    void join();

    // Stop taking entries from the queue without stopping the thread
    void pause();
    void resume();

    bool isRunning() const { return running_.load(); }
    // True while the loop is parked on pause
    bool isParked() const { return parked_.load(); }

private:
    int worker_id_;
    LogQueue& queue_;
    DeliveryPort& port_;
    const RetryStrategy& retry_;
    PipelineCounters& counters_;
    ShutdownSignal& shutdown_;
    bool failsafe_;
    std::chrono::milliseconds poll_interval_;

    std::thread worker_thread_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::atomic<bool> paused_;
    std::atomic<bool> parked_;

    std::mutex pause_mutex_;
    std::condition_variable pause_cv_;

    // Main worker loop
    void run();

    // Deliver a single entry, updating counters
    void deliver(const LogEntry& entry);
};

#endif // DELIVERY_WORKER_HPP
