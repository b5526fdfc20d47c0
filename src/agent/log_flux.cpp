#include "log_flux.hpp"
#include <stdexcept>
#include <utility>

std::mutex LogFlux::mutex_;
std::shared_ptr<ResilientClient> LogFlux::client_;

void LogFlux::init(const ResilientClientConfig& config) {
    install(ResilientClient::create(config));
}

void LogFlux::init(const ResilientClientConfig& config, std::shared_ptr<DeliveryPort> port) {
    install(std::make_shared<ResilientClient>(config, std::move(port)));
}

void LogFlux::install(std::shared_ptr<ResilientClient> client) {
    std::shared_ptr<ResilientClient> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(client_);
        client_ = std::move(client);
    }
    if (previous) {
        previous->close();
    }
}

void LogFlux::close() {
    std::shared_ptr<ResilientClient> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = std::move(client_);
        client_.reset();
    }
    if (current) {
        current->close();
    }
}

bool LogFlux::isInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_ != nullptr;
}

std::shared_ptr<ResilientClient> LogFlux::client() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_) {
        throw std::logic_error("LogFlux not initialized. Call LogFlux::init() first.");
    }
    return client_;
}
