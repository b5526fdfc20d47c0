#include "delivery_worker.hpp"
#include "../errors.hpp"
#include "../transport/entry_codec.hpp"
#include <iostream>

DeliveryWorker::DeliveryWorker(int worker_id,
                               LogQueue& queue,
                               DeliveryPort& port,
                               const RetryStrategy& retry,
                               PipelineCounters& counters,
                               ShutdownSignal& shutdown,
                               bool failsafe,
                               std::chrono::milliseconds poll_interval)
    : worker_id_(worker_id)
    , queue_(queue)
    , port_(port)
    , retry_(retry)
    , counters_(counters)
    , shutdown_(shutdown)
    , failsafe_(failsafe)
    , poll_interval_(poll_interval)
    , running_(false)
    , stop_requested_(false)
    , paused_(false)
    , parked_(false) {}

DeliveryWorker::~DeliveryWorker() {
    signalStop();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void DeliveryWorker::start() {
    if (running_) {
        return;
    }

    running_ = true;
    stop_requested_ = false;
    worker_thread_ = std::thread(&DeliveryWorker::run, this);

    std::cout << "Worker " << worker_id_ << ": Started" << std::endl;
}

void DeliveryWorker::signalStop() {
    {
        std::lock_guard<std::mutex> lock(pause_mutex_);
        stop_requested_ = true;
    }
    pause_cv_.notify_all();
}

bool DeliveryWorker::waitForStop(std::chrono::milliseconds timeout) {
    if (!worker_thread_.joinable()) {
        return true;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;

    // Signal stop if not already done
    signalStop();

    // std::thread has no timed join
    while (running_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (running_) {
        std::cerr << "Worker " << worker_id_ << ": Timeout waiting for worker to stop" << std::endl;
        return false;
    }

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    return true;
}

void DeliveryWorker::join() {
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void DeliveryWorker::pause() {
    std::lock_guard<std::mutex> lock(pause_mutex_);
    paused_ = true;
}

void DeliveryWorker::resume() {
    {
        std::lock_guard<std::mutex> lock(pause_mutex_);
        paused_ = false;
    }
    pause_cv_.notify_all();
}

void DeliveryWorker::run() {
    while (!stop_requested_) {
        {
            std::unique_lock<std::mutex> lock(pause_mutex_);
            if (paused_ && !stop_requested_) {
                parked_ = true;
                pause_cv_.wait(lock, [this] { return !paused_ || stop_requested_; });
                parked_ = false;
            }
        }
        if (stop_requested_) {
            break;
        }

        auto entry = queue_.poll(poll_interval_);
        if (entry) {
            deliver(*entry);
        }

        if (queue_.isShutdown() && queue_.empty()) {
            break;
        }
    }

    running_ = false;
    std::cout << "Worker " << worker_id_ << ": Stopped" << std::endl;
}

void DeliveryWorker::deliver(const LogEntry& entry) {
    try {
        std::string json = EntryCodec::toJson(entry);
        retry_.execute(
            [this, &json]() { return port_.send(json); },
            [this](std::chrono::milliseconds delay) { return !shutdown_.waitFor(delay); });
        counters_.sent++;
    } catch (const LogFluxError& e) {
        counters_.failed++;
        if (!failsafe_) {
            std::cerr << "Worker " << worker_id_ << ": Failed to deliver entry ["
                      << errorKindName(e.kind()) << "]: " << e.what() << std::endl;
        }
    } catch (const std::exception& e) {
        counters_.failed++;
        if (!failsafe_) {
            std::cerr << "Worker " << worker_id_ << ": Failed to deliver entry: " << e.what() << std::endl;
        }
    } catch (...) {
        counters_.failed++;
        if (!failsafe_) {
            std::cerr << "Worker " << worker_id_ << ": Failed to deliver entry: unknown exception" << std::endl;
        }
    }
}
