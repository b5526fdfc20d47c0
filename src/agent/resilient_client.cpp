#include "resilient_client.hpp"
#include "../errors.hpp"
#include "../transport/http_delivery_port.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace {

const ResilientClientConfig& validated(const ResilientClientConfig& config) {
    config.validate();
    return config;
}

} // namespace

const char* clientStateName(ClientState state) {
    switch (state) {
        case ClientState::Running:
            return "RUNNING";
        case ClientState::Draining:
            return "DRAINING";
        case ClientState::Stopped:
            return "STOPPED";
    }
    return "UNKNOWN";
}

ResilientClient::ResilientClient(const ResilientClientConfig& config, std::shared_ptr<DeliveryPort> port)
    : config_(validated(config))
    , port_(std::move(port))
    , encryptor_(config.client.secret)
    , retry_(config.retry)
    , queue_(LogQueue::create(static_cast<size_t>(config.queue_size), config.failsafe_mode))
    , state_(ClientState::Running) {
    if (!port_) {
        throw std::invalid_argument("Delivery port cannot be null");
    }

    for (int i = 0; i < config_.worker_count; ++i) {
        auto worker = std::make_unique<DeliveryWorker>(
            i, *queue_, *port_, retry_, counters_, shutdown_signal_,
            config_.failsafe_mode, config_.poll_interval);
        worker->start();
        workers_.push_back(std::move(worker));
    }

    if (config_.flush_interval.count() > 0) {
        flush_ticker_ = std::thread(&ResilientClient::runFlushTicker, this);
    }

    std::cout << "ResilientClient: Started " << config_.worker_count << " workers"
              << " (queue " << config_.queue_size
              << ", " << (config_.failsafe_mode ? "failsafe" : "strict") << " mode)" << std::endl;
}

ResilientClient::~ResilientClient() {
    close();
}

std::unique_ptr<ResilientClient> ResilientClient::create(const ResilientClientConfig& config) {
    config.validate();
    auto port = std::make_shared<HttpDeliveryPort>(config.client);
    return std::make_unique<ResilientClient>(config, std::move(port));
}

bool ResilientClient::sendLog(const std::string& message, LogLevel level) {
    return sendLog(message, level, std::chrono::system_clock::now());
}

bool ResilientClient::sendLog(const std::string& message, LogLevel level,
                              std::chrono::system_clock::time_point timestamp) {
    if (state_ != ClientState::Running) {
        return reject(ErrorKind::Closed, "Client is closed");
    }

    EncryptionResult encrypted;
    try {
        encrypted = encryptor_.encryptToResult(message);
    } catch (const EncryptionError& e) {
        if (!config_.failsafe_mode) {
            throw;
        }
        std::cerr << "ResilientClient: Dropping entry: " << e.what() << std::endl;
        return false;
    }

    return enqueue(LogEntry::fromEncryption(config_.client.node, encrypted, level, timestamp));
}

size_t ResilientClient::sendLogBatch(const std::vector<std::string>& messages, LogLevel level) {
    size_t accepted = 0;
    for (const auto& message : messages) {
        if (sendLog(message, level)) {
            accepted++;
        }
    }
    return accepted;
}

size_t ResilientClient::sendEntries(std::vector<LogEntry> entries) {
    size_t accepted = 0;
    for (auto& entry : entries) {
        if (state_ != ClientState::Running) {
            reject(ErrorKind::Closed, "Client is closed");
            break;
        }
        if (enqueue(std::move(entry))) {
            accepted++;
        }
    }
    return accepted;
}

bool ResilientClient::enqueue(LogEntry entry) {
    bool accepted;
    if (config_.failsafe_mode || config_.offer_timeout.count() == 0) {
        accepted = queue_->offer(std::move(entry));
    } else {
        accepted = queue_->offer(std::move(entry), config_.offer_timeout);
    }

    if (accepted) {
        return true;
    }
    if (queue_->isShutdown()) {
        return reject(ErrorKind::Closed, "Client is closed");
    }
    return reject(ErrorKind::QueueFull, "Log queue is full (capacity " +
                                            std::to_string(queue_->capacity()) + ")");
}

bool ResilientClient::reject(ErrorKind kind, const std::string& message) {
    if (config_.failsafe_mode) {
        return false;
    }
    if (kind == ErrorKind::QueueFull) {
        throw QueueFullError(message);
    }
    throw LogFluxError(kind, message);
}

bool ResilientClient::flush(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!queue_->empty()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

void ResilientClient::pause() {
    for (auto& worker : workers_) {
        worker->pause();
    }

    // A worker may be blocked in poll() or about to enter it; keep nudging
    // until every one has parked
    for (;;) {
        bool all_parked = true;
        for (const auto& worker : workers_) {
            if (worker->isRunning() && !worker->isParked()) {
                all_parked = false;
                break;
            }
        }
        if (all_parked) {
            return;
        }
        queue_->wakeConsumers();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void ResilientClient::resume() {
    for (auto& worker : workers_) {
        worker->resume();
    }
}

void ResilientClient::runFlushTicker() {
    while (!shutdown_signal_.waitFor(config_.flush_interval)) {
        if (!queue_->empty()) {
            queue_->wakeConsumers();
        }
    }
}

void ResilientClient::stopWorkers() {
    for (auto& worker : workers_) {
        worker->signalStop();
    }

    auto deadline = std::chrono::steady_clock::now() + config_.worker_grace_period;
    bool clean = true;
    for (auto& worker : workers_) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }
        if (!worker->waitForStop(remaining)) {
            clean = false;
        }
    }

    if (!clean) {
        // Abort whatever the stragglers are sending, then wait them out
        std::cerr << "ResilientClient: Workers exceeded grace period, cancelling in-flight deliveries"
                  << std::endl;
        port_->close();
        for (auto& worker : workers_) {
            worker->join();
        }
    }
}

void ResilientClient::close() {
    ClientState expected = ClientState::Running;
    if (!state_.compare_exchange_strong(expected, ClientState::Draining)) {
        return;
    }

    std::cout << "ResilientClient: Closing, " << queue_->size() << " entries queued" << std::endl;

    resume();
    if (!flush(config_.shutdown_flush_timeout)) {
        std::cerr << "ResilientClient: Flush timed out with " << queue_->size()
                  << " entries remaining" << std::endl;
    }

    queue_->shutdown();
    shutdown_signal_.trigger();
    if (flush_ticker_.joinable()) {
        flush_ticker_.join();
    }

    stopWorkers();

    auto leftover = queue_->drainAll();
    if (!leftover.empty()) {
        counters_.failed += leftover.size();
        std::cerr << "ResilientClient: " << leftover.size()
                  << " undelivered entries discarded on close" << std::endl;
    }

    encryptor_.clearCache();
    port_->close();
    state_ = ClientState::Stopped;

    PipelineStats final_stats = stats();
    std::cout << "ResilientClient: Stopped (sent=" << final_stats.total_sent
              << ", failed=" << final_stats.total_failed
              << ", dropped=" << final_stats.total_dropped << ")" << std::endl;
}

PipelineStats ResilientClient::stats() const {
    PipelineStats snapshot;
    snapshot.total_sent = counters_.sent.load();
    snapshot.total_failed = counters_.failed.load();
    snapshot.total_dropped = queue_->droppedCount();
    snapshot.queue_size = queue_->size();
    snapshot.queue_capacity = queue_->capacity();
    return snapshot;
}
