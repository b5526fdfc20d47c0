#ifndef STATS_SERVER_HPP
#define STATS_SERVER_HPP

#include "agent/resilient_client.hpp"
#include "crow.h"
#include <string>
#include <thread>

// Operational endpoints for a running agent:
//   GET  /health  liveness
//   GET  /ready   503 unless the client is Running
//   GET  /stats   PipelineStats as JSON
//   POST /flush   wait for the queue to drain (?timeout_ms=, default 5000)
class StatsServer {
public:
    explicit StatsServer(ResilientClient& client);
    ~StatsServer();

    StatsServer(const StatsServer&) = delete;
    StatsServer& operator=(const StatsServer&) = delete;

    // Serve on a background thread. Returns once the listener is up.
    void start(const std::string& host, int port);

    // Stop serving and join the thread. Safe to call more than once.
    void stop();

    bool isRunning() const { return server_thread_.joinable(); }

    // Setup routes on the provided app (for testing)
    void setupRoutes(crow::SimpleApp& app);

private:
    ResilientClient& client_;
    crow::SimpleApp app_;
    std::thread server_thread_;
};

#endif // STATS_SERVER_HPP
