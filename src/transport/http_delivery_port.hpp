#ifndef HTTP_DELIVERY_PORT_HPP
#define HTTP_DELIVERY_PORT_HPP

#include "../config.hpp"
#include "delivery_port.hpp"
#include <atomic>
#include <chrono>
#include <string>

// DeliveryPort over HTTP(S) using libcurl.
//
// Each request gets its own easy handle, so any number of workers may call
// send() concurrently. close() makes in-flight transfers abort at their next
// progress callback and every later call fail with ErrorKind::Cancelled.
class HttpDeliveryPort : public DeliveryPort {
public:
    static constexpr const char* kIngestPath = "/v1/ingest";

    explicit HttpDeliveryPort(const ClientConfig& config);
    ~HttpDeliveryPort() override;

    HttpDeliveryPort(const HttpDeliveryPort&) = delete;
    HttpDeliveryPort& operator=(const HttpDeliveryPort&) = delete;

    // POST the entry JSON to /v1/ingest. 200 and 201 are success; anything
    // else throws DeliveryError.
    DeliveryReceipt send(const std::string& serialized_entry) override;

    void close() override;
    bool isClosed() const { return closed_.load(); }

    // GET /health. Returns the body on 200, throws DeliveryError otherwise.
    std::string health();

    // GET /version
    std::string version();

    const std::string& baseUrl() const { return base_url_; }

private:
    struct HttpResponse {
        long status = 0;
        std::string body;
    };

    std::string base_url_;
    std::string api_key_;
    std::chrono::milliseconds timeout_;
    bool gzip_enabled_;
    std::atomic<bool> closed_;

    HttpResponse perform(const std::string& path, const std::string* post_body);
};

#endif // HTTP_DELIVERY_PORT_HPP
