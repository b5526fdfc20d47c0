#ifndef LOG_QUEUE_HPP
#define LOG_QUEUE_HPP

#include "../models/log_entry.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// Bounded FIFO of entries shared by the submitting threads and the delivery
// workers. size() never exceeds capacity(). Safe for any number of producers
// and consumers.
//
// The admission policy for a full queue is fixed by the subclass:
// BlockingLogQueue waits for space, FailsafeLogQueue drops and counts.
class LogQueue {
public:
    explicit LogQueue(size_t capacity);
    virtual ~LogQueue() = default;

    LogQueue(const LogQueue&) = delete;
    LogQueue& operator=(const LogQueue&) = delete;

    // Returns true if the entry was enqueued
    virtual bool offer(LogEntry entry) = 0;
    virtual bool offer(LogEntry entry, std::chrono::milliseconds timeout) = 0;

    // Remove the oldest entry, waiting up to timeout. Empty on timeout,
    // shutdown or wakeConsumers().
    std::optional<LogEntry> poll(std::chrono::milliseconds timeout);
    std::optional<LogEntry> tryPoll();

    // Remove everything currently queued
    std::vector<LogEntry> drainAll();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t remainingCapacity() const;
    bool empty() const;
    bool full() const;

    // Monotonic count of entries rejected by a failsafe offer
    uint64_t droppedCount() const { return dropped_count_.load(); }

    // Release every blocked producer and consumer. Later offers fail; poll
    // on an empty queue returns immediately.
    void shutdown();
    bool isShutdown() const { return shutdown_.load(); }

    // Release consumers currently blocked in poll() without shutting down
    void wakeConsumers();

    virtual bool isFailsafe() const = 0;

    static std::unique_ptr<LogQueue> create(size_t capacity, bool failsafe);

protected:
    const size_t capacity_;
    std::deque<LogEntry> entries_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::atomic<bool> shutdown_;
    std::atomic<uint64_t> dropped_count_;
    uint64_t wake_generation_;  // guarded by mutex_

    // Caller holds mutex_ and has checked there is room
    void pushLocked(LogEntry entry);
};

class BlockingLogQueue : public LogQueue {
public:
    explicit BlockingLogQueue(size_t capacity) : LogQueue(capacity) {}

    // Waits until space frees up or the queue shuts down
    bool offer(LogEntry entry) override;

    // Gives up after timeout without touching droppedCount
    bool offer(LogEntry entry, std::chrono::milliseconds timeout) override;

    bool isFailsafe() const override { return false; }
};

class FailsafeLogQueue : public LogQueue {
public:
    explicit FailsafeLogQueue(size_t capacity) : LogQueue(capacity) {}

    // Never blocks. A full queue drops the entry and bumps droppedCount.
    bool offer(LogEntry entry) override;

    // Same as offer(entry); the timeout is ignored
    bool offer(LogEntry entry, std::chrono::milliseconds timeout) override;

    bool isFailsafe() const override { return true; }
};

#endif // LOG_QUEUE_HPP
