#include "agent/resilient_client.hpp"
#include "stats_server.hpp"
#include "config.hpp"
#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <signal.h>

std::atomic<bool> g_running(true);

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

static void printUsage() {
    std::cerr << "Please set required environment variables:" << std::endl;
    std::cerr << "  LOGFLUX_SERVER_URL - Ingestion API base URL (http:// or https://)" << std::endl;
    std::cerr << "  LOGFLUX_API_KEY    - API key (starts with lf_)" << std::endl;
    std::cerr << "  LOGFLUX_NODE       - Node name attached to every entry" << std::endl;
    std::cerr << "  LOGFLUX_SECRET     - Shared encryption secret" << std::endl;
    std::cerr << "Optional: LOGFLUX_LEVEL (default INFO), STATS_PORT" << std::endl;
}

int main() {
    try {
        // No SA_RESTART, so a signal interrupts the blocking stdin read
        struct sigaction action {};
        action.sa_handler = signalHandler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);

        const char* node = std::getenv("LOGFLUX_NODE");
        const char* secret = std::getenv("LOGFLUX_SECRET");
        if (!node || !secret) {
            std::cerr << "Fatal error: LOGFLUX_NODE and LOGFLUX_SECRET environment variables are required"
                      << std::endl;
            printUsage();
            return 1;
        }

        LogLevel level = log_level::fromName(config_env::getString("LOGFLUX_LEVEL", "INFO"));
        ResilientClientConfig config = ResilientClientConfig::fromEnv(node, secret);
        std::unique_ptr<ResilientClient> client = ResilientClient::create(config);

        // Declared after the client so it is torn down first on every exit path
        std::unique_ptr<StatsServer> stats_server;
        int stats_port = config_env::getInt("STATS_PORT", 0);
        if (stats_port > 0) {
            stats_server = std::make_unique<StatsServer>(*client);
            stats_server->start("0.0.0.0", stats_port);
        }

        std::cout << "LogFlux agent started (node " << config.client.node
                  << ", server " << config.client.server_url
                  << ", level " << log_level::toString(level) << ")" << std::endl;

        std::string line;
        uint64_t lines_read = 0;
        while (g_running && std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }
            lines_read++;
            client->sendLog(line, level);
        }

        std::cout << "Shutting down after " << lines_read << " lines..." << std::endl;
        client->close();
        if (stats_server) {
            stats_server->stop();
        }

        PipelineStats stats = client->stats();
        std::cout << "Final stats: sent=" << stats.total_sent
                  << " failed=" << stats.total_failed
                  << " dropped=" << stats.total_dropped << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        printUsage();
        return 1;
    }
    return 0;
}
