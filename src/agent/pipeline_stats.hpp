#ifndef PIPELINE_STATS_HPP
#define PIPELINE_STATS_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>

// Point-in-time snapshot of the delivery pipeline
struct PipelineStats {
    uint64_t total_sent = 0;
    uint64_t total_failed = 0;
    uint64_t total_dropped = 0;
    size_t queue_size = 0;
    size_t queue_capacity = 0;

    bool isQueueFull() const { return queue_capacity > 0 && queue_size >= queue_capacity; }

    double queueUtilization() const {
        if (queue_capacity == 0) {
            return 0.0;
        }
        return static_cast<double>(queue_size) / static_cast<double>(queue_capacity);
    }
};

// Live counters shared by the workers; only ever incremented
struct PipelineCounters {
    std::atomic<uint64_t> sent{0};
    std::atomic<uint64_t> failed{0};
};

#endif // PIPELINE_STATS_HPP
