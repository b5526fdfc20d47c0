#ifndef DELIVERY_PORT_HPP
#define DELIVERY_PORT_HPP

#include <cstdint>
#include <string>

// Parsed acknowledgement from the ingestion API
struct DeliveryReceipt {
    int http_status = 0;
    std::string status;
    int64_t id = 0;
    double timestamp = 0.0;
    std::string message;
};

// Ships one serialized entry to the ingestion backend.
//
// Implementations must be safe to call from every delivery worker at once.
// Failures are reported by throwing DeliveryError with a kind the retry
// strategy can classify.
class DeliveryPort {
public:
    virtual ~DeliveryPort() = default;

    virtual DeliveryReceipt send(const std::string& serialized_entry) = 0;

    // Abort in-flight sends and reject new ones. Every send() blocked at the
    // time of the call must return or throw promptly; ResilientClient joins
    // its workers unconditionally after calling this.
    virtual void close() = 0;
};

#endif // DELIVERY_PORT_HPP
