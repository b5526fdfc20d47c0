#include <gtest/gtest.h>
#include "stats_server.hpp"
#include "fake_delivery_port.hpp"
#include "mock_ingest_server.hpp"
#include "crow.h"
#include <memory>
#include <string>
#include <vector>

class StatsServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.client.server_url = "http://localhost:8080";
        config_.client.node = "stats-test";
        config_.client.api_key = "lf_test_key";
        config_.client.secret = "stats-secret";
        config_.queue_size = 4;
        config_.worker_count = 1;
        config_.flush_interval = std::chrono::milliseconds(0);
        config_.poll_interval = std::chrono::milliseconds(20);

        port_ = std::make_shared<FakeDeliveryPort>();
        client_ = std::make_unique<ResilientClient>(config_, port_);
        server_ = std::make_unique<StatsServer>(*client_);
        server_->setupRoutes(app_);
        app_.validate();  // Required to make sure all route handlers are in order
    }

    crow::response request(const std::string& url, crow::HTTPMethod method = "GET"_method) {
        crow::request req;
        req.url = url;
        req.method = method;
        auto query = url.find('?');
        if (query != std::string::npos) {
            req.url = url.substr(0, query);
            req.url_params = crow::query_string(url);
        }
        crow::response res;
        app_.handle_full(req, res);
        return res;
    }

    static std::vector<LogEntry> makeEntries(int count) {
        std::vector<LogEntry> entries;
        for (int i = 0; i < count; ++i) {
            entries.emplace_back("stats-test", "payload-" + std::to_string(i), LogLevel::INFO,
                                 std::chrono::system_clock::now(), 1, "aXY=", "c2FsdA==");
        }
        return entries;
    }

    ResilientClientConfig config_;
    std::shared_ptr<FakeDeliveryPort> port_;
    std::unique_ptr<ResilientClient> client_;
    std::unique_ptr<StatsServer> server_;
    crow::SimpleApp app_;
};

TEST_F(StatsServerTest, HealthIsAlwaysOk) {
    crow::response res = request("/health");
    EXPECT_EQ(res.code, 200);
    EXPECT_EQ(res.body, "OK");
}

TEST_F(StatsServerTest, ReadyReflectsClientState) {
    EXPECT_EQ(request("/ready").code, 200);

    client_->close();
    crow::response res = request("/ready");
    EXPECT_EQ(res.code, 503);
    EXPECT_NE(res.body.find("STOPPED"), std::string::npos);
}

TEST_F(StatsServerTest, StatsReportsQueueAndCounters) {
    client_->pause();
    client_->sendEntries(makeEntries(6));

    crow::response res = request("/stats");
    ASSERT_EQ(res.code, 200);

    auto json = crow::json::load(res.body);
    ASSERT_TRUE(json);
    EXPECT_EQ(json["queue_size"].i(), 4);
    EXPECT_EQ(json["queue_capacity"].i(), 4);
    EXPECT_EQ(json["total_dropped"].i(), 2);
    EXPECT_EQ(json["total_sent"].i(), 0);
    EXPECT_TRUE(json["queue_full"].b());
    EXPECT_DOUBLE_EQ(json["queue_utilization"].d(), 1.0);
    EXPECT_EQ(std::string(json["state"].s()), "RUNNING");
}

TEST_F(StatsServerTest, FlushDrainsQueue) {
    client_->pause();
    client_->sendEntries(makeEntries(2));

    crow::response timed_out = request("/flush?timeout_ms=20", "POST"_method);
    EXPECT_EQ(timed_out.code, 504);

    client_->resume();
    crow::response res = request("/flush?timeout_ms=2000", "POST"_method);
    EXPECT_EQ(res.code, 200);

    auto json = crow::json::load(res.body);
    ASSERT_TRUE(json);
    EXPECT_TRUE(json["flushed"].b());
    EXPECT_EQ(json["queue_size"].i(), 0);
}

TEST_F(StatsServerTest, FlushRejectsBadTimeout) {
    EXPECT_EQ(request("/flush?timeout_ms=soon", "POST"_method).code, 400);
}

TEST_F(StatsServerTest, FlushRequiresPost) {
    EXPECT_NE(request("/flush").code, 200);
}

TEST_F(StatsServerTest, ServesInBackgroundAndJoinsOnDestruction) {
    auto live = std::make_unique<StatsServer>(*client_);
    live->start("127.0.0.1", MockIngestServer::pickFreePort());
    EXPECT_TRUE(live->isRunning());

    // Destroying a running server stops it and joins its thread
    live.reset();

    auto stopped = std::make_unique<StatsServer>(*client_);
    stopped->start("127.0.0.1", MockIngestServer::pickFreePort());
    stopped->stop();
    EXPECT_FALSE(stopped->isRunning());
    stopped->stop();
}
