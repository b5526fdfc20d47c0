#ifndef RESILIENT_CLIENT_HPP
#define RESILIENT_CLIENT_HPP

#include "../config.hpp"
#include "../crypto/encryptor.hpp"
#include "../models/log_entry.hpp"
#include "../transport/delivery_port.hpp"
#include "delivery_worker.hpp"
#include "log_queue.hpp"
#include "pipeline_stats.hpp"
#include "retry_strategy.hpp"
#include "shutdown_signal.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

enum class ClientState {
    Running,
    Draining,
    Stopped
};

const char* clientStateName(ClientState state);

// Asynchronous, encrypted log shipping pipeline.
//
// sendLog() encrypts on the calling thread and enqueues the entry; a fixed
// pool of DeliveryWorkers drains the queue through the DeliveryPort with
// retry. In failsafe mode every submission failure is absorbed and shows up
// only in stats(). In strict mode a full queue, an encryption failure or a
// closed client throws from sendLog().
//
// State moves Running -> Draining -> Stopped, once. After close() the queue
// is empty and totalSent + totalFailed equals the number of accepted entries.
class ResilientClient {
public:
    ResilientClient(const ResilientClientConfig& config, std::shared_ptr<DeliveryPort> port);
    ~ResilientClient();

    ResilientClient(const ResilientClient&) = delete;
    ResilientClient& operator=(const ResilientClient&) = delete;

    // Client backed by an HttpDeliveryPort for config.client
    static std::unique_ptr<ResilientClient> create(const ResilientClientConfig& config);

    // Returns true if the entry was queued
    bool sendLog(const std::string& message, LogLevel level = LogLevel::INFO);
    bool sendLog(const std::string& message, LogLevel level,
                 std::chrono::system_clock::time_point timestamp);

    bool debug(const std::string& message) { return sendLog(message, LogLevel::DEBUG); }
    bool info(const std::string& message) { return sendLog(message, LogLevel::INFO); }
    bool warn(const std::string& message) { return sendLog(message, LogLevel::WARN); }
    bool error(const std::string& message) { return sendLog(message, LogLevel::ERROR); }
    bool fatal(const std::string& message) { return sendLog(message, LogLevel::FATAL); }

    // Number of messages accepted. Strict mode stops at the first failure
    // and throws.
    size_t sendLogBatch(const std::vector<std::string>& messages, LogLevel level = LogLevel::INFO);

    // Enqueue entries that were already encrypted
    size_t sendEntries(std::vector<LogEntry> entries);

    // Wait until the queue is empty or timeout elapses. Entries already taken
    // by a worker may still be in flight when this returns true.
    bool flush(std::chrono::milliseconds timeout);

    // Park every worker so entries accumulate in the queue. Returns once no
    // worker will take another entry.
    void pause();
    void resume();

    // Idempotent. Drains, stops the workers, fails what is left, wipes the
    // key cache and closes the port.
    void close();

    PipelineStats stats() const;
    ClientState state() const { return state_.load(); }
    bool isFailsafe() const { return config_.failsafe_mode; }

    // For decrypting entries produced by this client
    Encryptor& encryptor() { return encryptor_; }

private:
    ResilientClientConfig config_;
    std::shared_ptr<DeliveryPort> port_;
    Encryptor encryptor_;
    RetryStrategy retry_;
    std::unique_ptr<LogQueue> queue_;
    PipelineCounters counters_;
    ShutdownSignal shutdown_signal_;

    std::vector<std::unique_ptr<DeliveryWorker>> workers_;
    std::thread flush_ticker_;
    std::atomic<ClientState> state_;

    // Offer one entry under the configured admission policy
    bool enqueue(LogEntry entry);

    // Report a rejected submission according to the failsafe setting
    bool reject(ErrorKind kind, const std::string& message);

    void runFlushTicker();
    void stopWorkers();
};

#endif // RESILIENT_CLIENT_HPP
