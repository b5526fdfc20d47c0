#ifndef LOG_FLUX_HPP
#define LOG_FLUX_HPP

#include "resilient_client.hpp"
#include <memory>
#include <mutex>

// Optional process-wide client for code that cannot thread a
// ResilientClient through. Nothing inside the library reads it.
class LogFlux {
public:
    // Replaces (and closes) any client already installed
    static void init(const ResilientClientConfig& config);
    static void init(const ResilientClientConfig& config, std::shared_ptr<DeliveryPort> port);

    static void close();
    static bool isInitialized();

    // Throws std::logic_error if init() has not been called
    static std::shared_ptr<ResilientClient> client();

    static bool debug(const std::string& message) { return client()->debug(message); }
    static bool info(const std::string& message) { return client()->info(message); }
    static bool warn(const std::string& message) { return client()->warn(message); }
    static bool error(const std::string& message) { return client()->error(message); }
    static bool fatal(const std::string& message) { return client()->fatal(message); }

private:
    static std::mutex mutex_;
    static std::shared_ptr<ResilientClient> client_;

    static void install(std::shared_ptr<ResilientClient> client);
};

#endif // LOG_FLUX_HPP
