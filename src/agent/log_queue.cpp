#include "log_queue.hpp"
#include <stdexcept>
#include <utility>

LogQueue::LogQueue(size_t capacity)
    : capacity_(capacity)
    , shutdown_(false)
    , dropped_count_(0)
    , wake_generation_(0) {
    if (capacity == 0) {
        throw std::invalid_argument("Queue capacity must be positive");
    }
}

std::unique_ptr<LogQueue> LogQueue::create(size_t capacity, bool failsafe) {
    if (failsafe) {
        return std::make_unique<FailsafeLogQueue>(capacity);
    }
    return std::make_unique<BlockingLogQueue>(capacity);
}

void LogQueue::pushLocked(LogEntry entry) {
    entries_.push_back(std::move(entry));
    not_empty_.notify_one();
}

std::optional<LogEntry> LogQueue::poll(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    uint64_t generation = wake_generation_;

    not_empty_.wait_for(lock, timeout, [this, generation] {
        return !entries_.empty() || shutdown_ || wake_generation_ != generation;
    });

    if (entries_.empty()) {
        return std::nullopt;
    }

    LogEntry entry = std::move(entries_.front());
    entries_.pop_front();
    not_full_.notify_one();
    return entry;
}

std::optional<LogEntry> LogQueue::tryPoll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
        return std::nullopt;
    }
    LogEntry entry = std::move(entries_.front());
    entries_.pop_front();
    not_full_.notify_one();
    return entry;
}

std::vector<LogEntry> LogQueue::drainAll() {
    std::vector<LogEntry> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.reserve(entries_.size());
        while (!entries_.empty()) {
            drained.push_back(std::move(entries_.front()));
            entries_.pop_front();
        }
    }
    not_full_.notify_all();
    return drained;
}

size_t LogQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t LogQueue::remainingCapacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_ - entries_.size();
}

bool LogQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

bool LogQueue::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size() >= capacity_;
}

void LogQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

void LogQueue::wakeConsumers() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++wake_generation_;
    }
    not_empty_.notify_all();
}

bool BlockingLogQueue::offer(LogEntry entry) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] {
        return entries_.size() < capacity_ || shutdown_;
    });

    if (shutdown_) {
        return false;
    }
    pushLocked(std::move(entry));
    return true;
}

bool BlockingLogQueue::offer(LogEntry entry, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool has_room = not_full_.wait_for(lock, timeout, [this] {
        return entries_.size() < capacity_ || shutdown_;
    });

    if (!has_room || shutdown_) {
        return false;
    }
    pushLocked(std::move(entry));
    return true;
}

bool FailsafeLogQueue::offer(LogEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return false;
    }
    if (entries_.size() >= capacity_) {
        dropped_count_++;
        return false;
    }
    pushLocked(std::move(entry));
    return true;
}

bool FailsafeLogQueue::offer(LogEntry entry, std::chrono::milliseconds /*timeout*/) {
    return offer(std::move(entry));
}
