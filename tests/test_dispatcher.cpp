//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_dispatcher.cpp
// Purpose: GoogleTests for the buffered upstream client (retry classification, backoff and timeouts)
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "chatproxy/ConcurrencyLimiter.hpp"
#include "chatproxy/ConnectionPool.hpp"
#include "chatproxy/UpstreamDispatcher.hpp"
#include "chatproxy/errors/Errors.h"
#include "MiniUpstream.h"

using namespace chatproxy;
using namespace std::chrono_literals;
namespace net = boost::asio;
namespace beast = boost::beast;
using testutil::MiniUpstream;

namespace {

ProviderConfig providerFor(const std::string& baseUrl, int maxRetries = 2) {
    ProviderConfig p;
    p.id = "local";
    p.baseUrl = baseUrl;
    p.apiKeyEnv = "LOCAL_KEY";
    p.timeoutMs = 5000;
    p.maxRetries = maxRetries;
    p.maxConcurrent = 2;
    return p;
}

// Test fixture wiring a dispatcher with millisecond backoff.
class DispatcherTest : public ::testing::Test {
protected:
    net::io_context ioc;
    ConnectionPoolManager pools{ioc.get_executor()};
    ConcurrencyLimiter limiter;
    UpstreamDispatcher dispatcher{pools, limiter, RetryPolicy{1, 2, 0}};

    UpstreamResponse send(const ProviderConfig& p) {
        return testutil::RunAwaitable(ioc, dispatcher.Send(p, R"({"model":"m","messages":[]})", "sk-local"));
    }
};

} // namespace

TEST_F(DispatcherTest, ReturnsSuccessfulResponse) {
    MiniUpstream up([](beast::tcp_stream& s, const testutil::Request& req) {
        MiniUpstream::writeJson(s, req, 200, R"({"id":"c1","model":"upstream-model"})");
        return true;
    });
    up.start();

    auto res = send(providerFor(up.baseUrl()));
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, R"({"id":"c1","model":"upstream-model"})");
    EXPECT_EQ(res.headers["Content-Type"], "application/json");
    EXPECT_EQ(up.lastRequest().body(), R"({"model":"m","messages":[]})");
    EXPECT_EQ(std::string(up.lastRequest()[beast::http::field::authorization]), "Bearer sk-local");
}

TEST_F(DispatcherTest, RetriesServerErrorThenSucceeds) {
    std::atomic<int> calls{0};
    MiniUpstream up([&calls](beast::tcp_stream& s, const testutil::Request& req) {
        if (calls++ == 0) {
            MiniUpstream::writeJson(s, req, 500, R"({"error":"boom"})");
        } else {
            MiniUpstream::writeJson(s, req, 200, R"({"ok":true})");
        }
        return true;
    });
    up.start();

    auto res = send(providerFor(up.baseUrl()));
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(up.requests.load(), 2);
    EXPECT_EQ(limiter.Stats("local").available, 2u);
}

TEST_F(DispatcherTest, ClientErrorIsNotRetried) {
    MiniUpstream up([](beast::tcp_stream& s, const testutil::Request& req) {
        MiniUpstream::writeJson(s, req, 400, R"({"error":{"message":"bad field"}})");
        return true;
    });
    up.start();

    try {
        (void)send(providerFor(up.baseUrl()));
        FAIL() << "expected UpstreamError";
    } catch (const errors::UpstreamError& e) {
        EXPECT_EQ(e.httpStatus, 400);
        EXPECT_EQ(e.upstreamStatus, 400);
        EXPECT_EQ(e.body, R"({"error":{"message":"bad field"}})");
        EXPECT_FALSE(e.timedOut);
    }
    EXPECT_EQ(up.requests.load(), 1);
    EXPECT_EQ(limiter.Stats("local").available, 2u);
}

TEST_F(DispatcherTest, GivesUpAfterMaxRetries) {
    MiniUpstream up([](beast::tcp_stream& s, const testutil::Request& req) {
        MiniUpstream::writeJson(s, req, 503, R"({"error":"unavailable"})");
        return true;
    });
    up.start();

    try {
        (void)send(providerFor(up.baseUrl(), 2));
        FAIL() << "expected UpstreamError";
    } catch (const errors::UpstreamError& e) {
        EXPECT_EQ(e.httpStatus, 503);
        EXPECT_EQ(e.type, errors::ErrorType::Api);
    }
    EXPECT_EQ(up.requests.load(), 3);
}

TEST_F(DispatcherTest, RateLimitIsRetriedAndReportedAsRateLimit) {
    MiniUpstream up([](beast::tcp_stream& s, const testutil::Request& req) {
        MiniUpstream::writeJson(s, req, 429, R"({"error":"slow down"})");
        return true;
    });
    up.start();

    try {
        (void)send(providerFor(up.baseUrl(), 1));
        FAIL() << "expected UpstreamError";
    } catch (const errors::UpstreamError& e) {
        EXPECT_EQ(e.httpStatus, 429);
        EXPECT_EQ(e.type, errors::ErrorType::RateLimit);
    }
    EXPECT_EQ(up.requests.load(), 2);
}

TEST_F(DispatcherTest, TimeoutMapsToGatewayTimeout) {
    MiniUpstream up([](beast::tcp_stream& s, const testutil::Request& req) {
        std::this_thread::sleep_for(300ms);
        MiniUpstream::writeJson(s, req, 200, "{}");
        return false;
    });
    up.start();

    auto p = providerFor(up.baseUrl(), 0);
    p.timeoutMs = 50;
    try {
        (void)send(p);
        FAIL() << "expected UpstreamError";
    } catch (const errors::UpstreamError& e) {
        EXPECT_TRUE(e.timedOut);
        EXPECT_EQ(e.httpStatus, 504);
        EXPECT_FALSE(e.upstreamStatus.has_value());
    }
    EXPECT_EQ(limiter.Stats("local").available, 2u);
}

TEST_F(DispatcherTest, ConnectionFailureMapsToBadGateway) {
    unsigned short closedPort = 0;
    {
        net::io_context tmp;
        net::ip::tcp::acceptor a(tmp, net::ip::tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        closedPort = a.local_endpoint().port();
    }
    auto p = providerFor("http://127.0.0.1:" + std::to_string(closedPort) + "/v1", 0);
    try {
        (void)send(p);
        FAIL() << "expected UpstreamError";
    } catch (const errors::UpstreamError& e) {
        EXPECT_EQ(e.httpStatus, 502);
        EXPECT_FALSE(e.timedOut);
        EXPECT_NE(std::string(e.what()).find("failed"), std::string::npos);
    }
}

TEST_F(DispatcherTest, InvalidBaseUrlIsConfigurationError) {
    auto p = providerFor("ftp://example.com/v1", 0);
    EXPECT_THROW((void)send(p), errors::ConfigurationError);
    EXPECT_EQ(limiter.Stats("local").available, 2u);
}
