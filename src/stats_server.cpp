#include "stats_server.hpp"
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>

static crow::json::wvalue statsToJson(const PipelineStats& stats) {
    crow::json::wvalue json;
    json["total_sent"] = stats.total_sent;
    json["total_failed"] = stats.total_failed;
    json["total_dropped"] = stats.total_dropped;
    json["queue_size"] = stats.queue_size;
    json["queue_capacity"] = stats.queue_capacity;
    json["queue_utilization"] = stats.queueUtilization();
    json["queue_full"] = stats.isQueueFull();
    return json;
}

StatsServer::StatsServer(ResilientClient& client) : client_(client) {
    setupRoutes(app_);
}

StatsServer::~StatsServer() {
    stop();
}

void StatsServer::setupRoutes(crow::SimpleApp& app) {
    ResilientClient* client = &client_;  // Capture for lambdas

    CROW_ROUTE(app, "/health")
        ([](){
            return crow::response(200, "OK");
        });

    CROW_ROUTE(app, "/ready")
        ([client](){
            ClientState state = client->state();
            if (state != ClientState::Running) {
                return crow::response(503, std::string("Client ") + clientStateName(state));
            }
            return crow::response(200, "OK");
        });

    CROW_ROUTE(app, "/stats")
        ([client](){
            crow::json::wvalue json = statsToJson(client->stats());
            json["state"] = clientStateName(client->state());
            return crow::response(200, json);
        });

    CROW_ROUTE(app, "/flush")
        .methods("POST"_method)
        ([client](const crow::request& req){
            long timeout_ms = 5000;
            const char* timeout_param = req.url_params.get("timeout_ms");
            if (timeout_param) {
                char* end = nullptr;
                long parsed = std::strtol(timeout_param, &end, 10);
                if (end == timeout_param || *end != '\0' || parsed < 0) {
                    return crow::response(400, "Invalid timeout_ms");
                }
                timeout_ms = parsed;
            }

            std::cout << "Flush requested via HTTP endpoint" << std::endl;
            bool drained = client->flush(std::chrono::milliseconds(timeout_ms));

            crow::json::wvalue json = statsToJson(client->stats());
            json["flushed"] = drained;
            return crow::response(drained ? 200 : 504, json);
        });
}

void StatsServer::start(const std::string& host, int port) {
    if (server_thread_.joinable()) {
        return;
    }

    app_.bindaddr(host).port(static_cast<uint16_t>(port)).multithreaded();
    server_thread_ = std::thread([this]() {
        try {
            app_.run();
        } catch (const std::exception& e) {
            std::cerr << "Stats server failed: " << e.what() << std::endl;
        }
    });
    app_.wait_for_server_start();

    std::cout << "Stats server running at http://" << host << ":" << port << std::endl;
    std::cout << "  GET /health, GET /ready, GET /stats, POST /flush" << std::endl;
}

void StatsServer::stop() {
    if (!server_thread_.joinable()) {
        return;
    }
    app_.stop();
    server_thread_.join();
}
