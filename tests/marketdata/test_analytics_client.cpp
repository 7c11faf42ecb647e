/*
Chartwell — AnalyticsClient Tests
Role: Verify request construction, delivery, failure reporting and stale-response suppression
Testing Strategy: FakeHttpTransport completes requests by hand; queued deliveries flushed with processEvents
Coverage: Symbol normalization, null-on-switch, refresh, HTTP errors, malformed bodies, transport errors, generations
*/
#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QStringList>
#include <vector>
#include "marketdata/AnalyticsClient.hpp"
#include "fixtures/analytics_payloads.hpp"
#include "fixtures/fake_http_transport.hpp"

namespace {

ApiConfig testApi() {
    ApiConfig api;
    api.host = "analytics.test";
    api.port = 8443;
    api.tls = true;
    api.timeoutSeconds = 5;
    return api;
}

} // namespace

class AnalyticsClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        client = std::make_unique<AnalyticsClient>(transport, testApi());
        QObject::connect(client.get(), &DatasetFeed::datasetChanged, [this](DatasetPtr ds) {
            emitted.push_back(ds);
        });
        QObject::connect(client.get(), &AnalyticsClient::fetchFailed, [this](const QString& msg) {
            failures << msg;
        });
        QObject::connect(client.get(), &AnalyticsClient::fetchFinished, [this](const QString& symbol) {
            finished << symbol;
        });
    }

    static void flush() { QCoreApplication::processEvents(); }

    FakeHttpTransport transport;
    std::unique_ptr<AnalyticsClient> client;
    std::vector<DatasetPtr> emitted;
    QStringList failures;
    QStringList finished;
};

// =============================================================================
// Requests
// =============================================================================

TEST_F(AnalyticsClientTest, RequestUsesConfiguredEndpoint) {
    client->requestSymbol("  aapl ");

    ASSERT_EQ(transport.requestCount(), 1u);
    const auto& req = transport.request(0);
    EXPECT_EQ(req.host, "analytics.test");
    EXPECT_EQ(req.port, "8443");
    EXPECT_EQ(req.target, "/api/patterns/AAPL");
    EXPECT_TRUE(req.useTls);
    EXPECT_EQ(req.timeout, std::chrono::seconds(5));
    EXPECT_EQ(client->currentSymbol(), "AAPL");
    EXPECT_TRUE(client->isFetching());
}

TEST_F(AnalyticsClientTest, EmptySymbolIgnored) {
    client->requestSymbol("   ");
    EXPECT_EQ(transport.requestCount(), 0u);
    EXPECT_EQ(client->generation(), 0u);
}

TEST_F(AnalyticsClientTest, RefreshWithoutSymbolDoesNothing) {
    client->refresh();
    EXPECT_EQ(transport.requestCount(), 0u);
}

// =============================================================================
// Delivery
// =============================================================================

TEST_F(AnalyticsClientTest, SuccessfulResponsePublishesDataset) {
    client->requestSymbol("AAPL");
    transport.respond(0, 200, fixtures::analyticsBody("AAPL", 30));
    flush();

    ASSERT_EQ(emitted.size(), 2u);
    EXPECT_EQ(emitted[0], nullptr);
    ASSERT_NE(emitted[1], nullptr);
    EXPECT_EQ(emitted[1]->candles.size(), 30u);
    EXPECT_EQ(client->current(), emitted[1]);
    EXPECT_EQ(finished, QStringList{"AAPL"});
    EXPECT_FALSE(client->isFetching());
}

TEST_F(AnalyticsClientTest, SymbolSwitchClearsCurrentDataset) {
    client->requestSymbol("AAPL");
    transport.respond(0, 200, fixtures::analyticsBody("AAPL", 10));
    flush();
    ASSERT_NE(client->current(), nullptr);

    client->requestSymbol("MSFT");
    EXPECT_EQ(client->current(), nullptr);
    EXPECT_EQ(emitted.back(), nullptr);
}

TEST_F(AnalyticsClientTest, RefreshKeepsCurrentDatasetUntilReplaced) {
    client->requestSymbol("AAPL");
    transport.respond(0, 200, fixtures::analyticsBody("AAPL", 10));
    flush();
    const DatasetPtr first = client->current();
    const size_t emissions = emitted.size();

    client->refresh();
    ASSERT_EQ(transport.requestCount(), 2u);
    EXPECT_EQ(client->current(), first);
    EXPECT_EQ(emitted.size(), emissions);

    transport.respond(1, 200, fixtures::analyticsBody("AAPL", 11));
    flush();
    ASSERT_NE(client->current(), nullptr);
    EXPECT_EQ(client->current()->candles.size(), 11u);
}

TEST_F(AnalyticsClientTest, SameSymbolRequestDoesNotClear) {
    client->requestSymbol("AAPL");
    transport.respond(0, 200, fixtures::analyticsBody("AAPL", 10));
    flush();

    client->requestSymbol("aapl");
    EXPECT_NE(client->current(), nullptr);
}

// =============================================================================
// Stale Responses
// =============================================================================

TEST_F(AnalyticsClientTest, SupersededResponseDropped) {
    client->requestSymbol("AAPL");
    client->requestSymbol("MSFT");
    ASSERT_EQ(transport.requestCount(), 2u);

    // AAPL answers after MSFT was requested
    transport.respond(0, 200, fixtures::analyticsBody("AAPL", 10));
    flush();
    EXPECT_EQ(client->current(), nullptr);
    EXPECT_TRUE(finished.isEmpty());

    transport.respond(1, 200, fixtures::analyticsBody("MSFT", 12));
    flush();
    ASSERT_NE(client->current(), nullptr);
    EXPECT_EQ(client->current()->symbol, "MSFT");
    EXPECT_EQ(finished, QStringList{"MSFT"});
}

TEST_F(AnalyticsClientTest, SupersededFailureDropped) {
    client->requestSymbol("AAPL");
    client->requestSymbol("MSFT");
    transport.fail(0, "connect refused");
    flush();
    EXPECT_TRUE(failures.isEmpty());
    EXPECT_TRUE(client->isFetching());
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(AnalyticsClientTest, HttpErrorCarriesBackendMessage) {
    client->requestSymbol("ZZZZ");
    transport.respond(0, 404, R"({"message": "Unknown symbol"})");
    flush();

    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures[0], "HTTP 404: Unknown symbol");
    EXPECT_FALSE(client->isFetching());
}

TEST_F(AnalyticsClientTest, HttpErrorWithoutBody) {
    client->requestSymbol("AAPL");
    transport.respond(0, 503, "");
    flush();

    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures[0], "HTTP 503");
}

TEST_F(AnalyticsClientTest, MalformedPayloadReported) {
    client->requestSymbol("AAPL");
    transport.respond(0, 200, R"({"symbol": "AAPL"})");
    flush();

    ASSERT_EQ(failures.size(), 1);
    EXPECT_TRUE(failures[0].startsWith("Malformed analytics payload"));
    EXPECT_EQ(client->current(), nullptr);
}

TEST_F(AnalyticsClientTest, TransportErrorReported) {
    client->requestSymbol("AAPL");
    transport.fail(0, "resolve analytics.test:8443 failed: host not found");
    flush();

    ASSERT_EQ(failures.size(), 1);
    EXPECT_TRUE(failures[0].contains("host not found"));
}

TEST_F(AnalyticsClientTest, DestroyedClientIgnoresLateResponse) {
    client->requestSymbol("AAPL");
    client.reset();
    transport.respond(0, 200, fixtures::analyticsBody("AAPL", 5));
    flush();
    SUCCEED();
}
