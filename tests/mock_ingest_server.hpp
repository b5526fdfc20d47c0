#ifndef MOCK_INGEST_SERVER_HPP
#define MOCK_INGEST_SERVER_HPP

#include "crow.h"
#include "models/log_entry.hpp"
#include "transport/entry_codec.hpp"
#include "transport/gzip.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Stand-in for the ingestion API on a loopback port
class MockIngestServer {
public:
    explicit MockIngestServer(const std::string& api_key = "lf_test_key")
        : api_key_(api_key), port_(pickFreePort()) {
        setupRoutes();
        app_.loglevel(crow::LogLevel::Warning);
        server_ = app_.bindaddr("127.0.0.1").port(port_).multithreaded().run_async();
        app_.wait_for_server_start();
    }

    ~MockIngestServer() {
        app_.stop();
        if (server_.valid()) {
            server_.wait();
        }
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    // Respond with `status` to the next n ingest requests
    void failNext(int n, int status = 503) {
        fail_remaining_ = n;
        fail_status_ = status;
    }

    void setResponseDelay(std::chrono::milliseconds delay) { delay_ms_ = delay.count(); }

    int requestCount() const { return request_count_.load(); }
    int gzipRequestCount() const { return gzip_count_.load(); }

    std::vector<LogEntry> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    // Reserve an unused loopback port by binding to port 0
    static uint16_t pickFreePort() {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            throw std::runtime_error("socket() failed");
        }
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            ::close(fd);
            throw std::runtime_error("Failed to reserve a loopback port");
        }
        ::close(fd);
        return ntohs(addr.sin_port);
    }

private:
    std::string api_key_;
    uint16_t port_;
    crow::SimpleApp app_;
    std::future<void> server_;

    std::atomic<int> fail_remaining_{0};
    std::atomic<int> fail_status_{503};
    std::atomic<long long> delay_ms_{0};
    std::atomic<int> request_count_{0};
    std::atomic<int> gzip_count_{0};

    mutable std::mutex mutex_;
    std::vector<LogEntry> received_;

    void setupRoutes() {
        CROW_ROUTE(app_, "/health")
            ([](){
                return crow::response(200, "OK");
            });

        CROW_ROUTE(app_, "/version")
            ([](){
                return crow::response(200, "{\"version\":\"1.0.0\"}");
            });

        CROW_ROUTE(app_, "/v1/ingest")
            .methods("POST"_method)
            ([this](const crow::request& req){
                request_count_++;

                long long delay = delay_ms_.load();
                if (delay > 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
                }

                if (req.get_header_value("Authorization") != "Bearer " + api_key_) {
                    return crow::response(401, "{\"error\":\"invalid api key\"}");
                }

                if (fail_remaining_.load() > 0) {
                    fail_remaining_--;
                    return crow::response(fail_status_.load(), "{\"error\":\"scripted failure\"}");
                }

                std::string body = req.body;
                if (req.get_header_value("Content-Encoding") == "gzip") {
                    gzip_count_++;
                    std::string decompressed;
                    if (!gzip::decompress(req.body, decompressed)) {
                        return crow::response(400, "{\"error\":\"bad gzip\"}");
                    }
                    body.swap(decompressed);
                }

                size_t id;
                try {
                    LogEntry entry = EntryCodec::fromJson(body);
                    std::lock_guard<std::mutex> lock(mutex_);
                    received_.push_back(entry);
                    id = received_.size();
                } catch (const std::exception& e) {
                    return crow::response(400, std::string("{\"error\":\"") + e.what() + "\"}");
                }

                crow::json::wvalue response;
                response["status"] = "success";
                response["id"] = id;
                response["timestamp"] = 1700000000.5;
                response["message"] = "Log entry accepted";
                response["extra_field"] = "ignored";
                return crow::response(201, response);
            });
    }
};

#endif // MOCK_INGEST_SERVER_HPP
