#include <gtest/gtest.h>
#include "errors.hpp"
#include "mock_ingest_server.hpp"
#include "transport/entry_codec.hpp"
#include "transport/http_delivery_port.hpp"
#include <chrono>
#include <memory>
#include <thread>

namespace {

LogEntry makeEntry(const std::string& payload) {
    return LogEntry("http-test", payload, LogLevel::INFO,
                    EntryCodec::fromEpochSeconds(1700000000.25), 1, "aXY=", "c2FsdA==");
}

} // namespace

class HttpDeliveryPortTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<MockIngestServer>("lf_test_key");
        config_.server_url = server_->url();
        config_.node = "http-test";
        config_.api_key = "lf_test_key";
        config_.secret = "secret";
        config_.timeout = std::chrono::milliseconds(5000);
    }

    std::unique_ptr<MockIngestServer> server_;
    ClientConfig config_;
};

TEST_F(HttpDeliveryPortTest, PostsEntryAndParsesReceipt) {
    HttpDeliveryPort port(config_);
    DeliveryReceipt receipt = port.send(EntryCodec::toJson(makeEntry("cGF5bG9hZA==")));

    EXPECT_EQ(receipt.http_status, 201);
    EXPECT_EQ(receipt.status, "success");
    EXPECT_EQ(receipt.id, 1);
    EXPECT_EQ(receipt.message, "Log entry accepted");

    auto received = server_->received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], makeEntry("cGF5bG9hZA=="));
}

TEST_F(HttpDeliveryPortTest, TrailingSlashInServerUrlIsIgnored) {
    config_.server_url += "/";
    HttpDeliveryPort port(config_);
    EXPECT_EQ(port.baseUrl(), server_->url());
    EXPECT_NO_THROW(port.send(EntryCodec::toJson(makeEntry("cA=="))));
}

TEST_F(HttpDeliveryPortTest, GzipBodiesAreDecodedByServer) {
    config_.compression = "gzip";
    HttpDeliveryPort port(config_);
    port.send(EntryCodec::toJson(makeEntry("Z3ppcHBlZA==")));

    EXPECT_EQ(server_->gzipRequestCount(), 1);
    auto received = server_->received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].payload(), "Z3ppcHBlZA==");
}

TEST_F(HttpDeliveryPortTest, ServerErrorsAreClassified) {
    HttpDeliveryPort port(config_);
    std::string body = EntryCodec::toJson(makeEntry("cA=="));

    server_->failNext(1, 503);
    try {
        port.send(body);
        FAIL() << "Expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ServerError);
        EXPECT_EQ(e.httpStatus(), 503);
        EXPECT_EQ(std::string(e.what()).rfind("HTTP 503", 0), 0u);
    }

    server_->failNext(1, 429);
    try {
        port.send(body);
        FAIL() << "Expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RateLimited);
    }

    server_->failNext(1, 400);
    try {
        port.send(body);
        FAIL() << "Expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ClientError);
        EXPECT_EQ(e.httpStatus(), 400);
    }
}

TEST_F(HttpDeliveryPortTest, WrongApiKeyIsClientError) {
    config_.api_key = "lf_wrong";
    HttpDeliveryPort port(config_);
    try {
        port.send(EntryCodec::toJson(makeEntry("cA==")));
        FAIL() << "Expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ClientError);
        EXPECT_EQ(e.httpStatus(), 401);
    }
}

TEST_F(HttpDeliveryPortTest, UnreachableServerIsNetworkError) {
    std::string url = server_->url();
    server_.reset();

    config_.server_url = url;
    HttpDeliveryPort port(config_);
    try {
        port.send("{}");
        FAIL() << "Expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Network);
        EXPECT_EQ(e.httpStatus(), 0);
    }
}

TEST_F(HttpDeliveryPortTest, SlowServerTimesOut) {
    server_->setResponseDelay(std::chrono::milliseconds(1500));
    config_.timeout = std::chrono::milliseconds(200);
    HttpDeliveryPort port(config_);

    try {
        port.send(EntryCodec::toJson(makeEntry("cA==")));
        FAIL() << "Expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
    }
}

TEST_F(HttpDeliveryPortTest, CloseAbortsInFlightAndRejectsLaterSends) {
    server_->setResponseDelay(std::chrono::milliseconds(3000));
    HttpDeliveryPort port(config_);

    std::thread closer([&port] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        port.close();
    });

    auto start = std::chrono::steady_clock::now();
    try {
        port.send(EntryCodec::toJson(makeEntry("cA==")));
        FAIL() << "Expected DeliveryError";
    } catch (const DeliveryError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(2500));
    closer.join();

    EXPECT_TRUE(port.isClosed());
    EXPECT_THROW(port.send("{}"), DeliveryError);
}

TEST_F(HttpDeliveryPortTest, HealthAndVersionEndpoints) {
    HttpDeliveryPort port(config_);
    EXPECT_EQ(port.health(), "OK");
    EXPECT_NE(port.version().find("1.0.0"), std::string::npos);
}
