/**
 * @file test_liveness_prober.cpp
 * @brief Unit tests for the liveness prober, endpoint checker and rate limiter
 */

#include <gtest/gtest.h>
#include <certstalker/liveness/liveness_prober.h>
#include "test_helpers.h"

using namespace certstalker;
using namespace certstalker::liveness;
using namespace test_helpers;
using model::EndpointTarget;
using namespace std::chrono;

namespace {

/// TCP connector answering from a fixed set of "host:port" strings
class FakeTcpConnector : public TcpConnector {
public:
    std::set<std::string> open;
    mutable int calls = 0;

    ConnectResult connect(const std::string& host, int port, milliseconds) const override {
        calls++;
        ConnectResult result;
        result.connected = open.count(host + ":" + std::to_string(port)) > 0;
        if (!result.connected) {
            result.error = "Connection refused";
        }
        return result;
    }
};

} // anonymous namespace

// ============================================================================
// LivenessProber
// ============================================================================

class LivenessProberTest : public ::testing::Test {
protected:
    std::shared_ptr<MockEndpointChecker> checker_ = std::make_shared<MockEndpointChecker>();

    LivenessProber makeProber(size_t workers = 4, double rate = 0.0) {
        ProberOptions options;
        options.workers = workers;
        options.rateLimit = rate;
        return LivenessProber(checker_, options);
    }
};

TEST_F(LivenessProberTest, Constructor_NullCheckerThrows) {
    EXPECT_THROW(LivenessProber(nullptr), std::invalid_argument);
}

TEST_F(LivenessProberTest, Constructor_ZeroWorkersBecomesOne) {
    ProberOptions options;
    options.workers = 0;
    LivenessProber prober(checker_, options);
    EXPECT_EQ(prober.options().workers, 1u);
}

TEST_F(LivenessProberTest, Probe_EveryTargetExactlyOnce) {
    auto results = makeProber().probe({"a.example.com", "b.example.com", "c.example.com"}, {443, 80});

    EXPECT_EQ(results.size(), 6u);
    EXPECT_EQ(checker_->calls.load(), 6);
    for (const auto& [target, result] : results) {
        EXPECT_EQ(result.endpoint, target);
        EXPECT_FALSE(result.reachable);
        EXPECT_TRUE(result.error.has_value());
    }
}

TEST_F(LivenessProberTest, Probe_ReachableAndUnreachable) {
    checker_->up = {"www.example.com:443"};
    auto results = makeProber().probe({"www.example.com", "down.example.com"}, {443});

    const auto& up = results.at(EndpointTarget{"www.example.com", 443});
    EXPECT_TRUE(up.reachable);
    EXPECT_EQ(up.statusCode, std::optional<int>(200));
    EXPECT_FALSE(up.error.has_value());

    const auto& down = results.at(EndpointTarget{"down.example.com", 443});
    EXPECT_FALSE(down.reachable);
    ASSERT_TRUE(down.error.has_value());
    EXPECT_FALSE(down.error->empty());
}

TEST_F(LivenessProberTest, Probe_ThrowingCheckerIsCaptured) {
    checker_->throwing = {"bad.example.com:443"};
    auto results = makeProber().probe({"bad.example.com", "ok.example.com"}, {443});

    ASSERT_EQ(results.size(), 2u);
    const auto& bad = results.at(EndpointTarget{"bad.example.com", 443});
    EXPECT_FALSE(bad.reachable);
    EXPECT_NE(bad.error->find("checker exploded"), std::string::npos);
}

TEST_F(LivenessProberTest, Probe_DuplicatesCollapsed) {
    auto results = makeProber().probe({"www.example.com", "www.example.com"}, {443, 443, 80});
    EXPECT_EQ(results.size(), 2u);
    EXPECT_EQ(checker_->calls.load(), 2);
}

TEST_F(LivenessProberTest, Probe_EmptyInput) {
    EXPECT_TRUE(makeProber().probe({}, {443}).empty());
    EXPECT_TRUE(makeProber().probe({"www.example.com"}, {}).empty());
    EXPECT_EQ(checker_->calls.load(), 0);
}

TEST_F(LivenessProberTest, Probe_WorkerBound) {
    checker_->delay = milliseconds(20);
    std::vector<std::string> hosts;
    for (int i = 0; i < 12; ++i) {
        hosts.push_back("h" + std::to_string(i) + ".example.com");
    }

    auto results = makeProber(3).probe(hosts, {443});
    EXPECT_EQ(results.size(), 12u);
    EXPECT_LE(checker_->maxActive.load(), 3);
}

TEST_F(LivenessProberTest, Probe_DeadlineAbandonsPendingChecks) {
    checker_->delay = milliseconds(300);
    std::vector<std::string> hosts;
    for (int i = 0; i < 6; ++i) {
        hosts.push_back("h" + std::to_string(i) + ".example.com");
    }

    auto start = steady_clock::now();
    auto results = makeProber(1).probe(hosts, {443}, steady_clock::now() + milliseconds(100));
    EXPECT_LT(steady_clock::now() - start, milliseconds(1000));

    // Completeness holds even when the deadline cuts the run short
    ASSERT_EQ(results.size(), 6u);
    int abandoned = 0;
    for (const auto& [target, result] : results) {
        EXPECT_FALSE(result.reachable);
        ASSERT_TRUE(result.error.has_value());
        if (result.error->find("run timeout") != std::string::npos) {
            ++abandoned;
        }
    }
    EXPECT_GE(abandoned, 5);
}

TEST_F(LivenessProberTest, Probe_RateLimitPacesStarts) {
    auto start = steady_clock::now();
    auto results = makeProber(4, 20.0).probe({"a.example.com", "b.example.com", "c.example.com",
                                              "d.example.com", "e.example.com"}, {443});
    auto elapsed = steady_clock::now() - start;

    EXPECT_EQ(results.size(), 5u);
    // Five starts at 20/s need at least four 50ms gaps
    EXPECT_GE(elapsed, milliseconds(180));
}

// ============================================================================
// RateLimiter
// ============================================================================

TEST(RateLimiterTest, ZeroRateNeverWaits) {
    RateLimiter limiter(0.0);
    utils::CancellationToken token;
    auto start = steady_clock::now();
    for (int i = 0; i < 100; ++i) {
        EXPECT_TRUE(limiter.wait(token));
    }
    EXPECT_LT(steady_clock::now() - start, milliseconds(50));
}

TEST(RateLimiterTest, CancelledWaitReturnsFalse) {
    RateLimiter limiter(0.5);
    utils::CancellationToken token;
    EXPECT_TRUE(limiter.wait(token));   // First slot is immediate
    token.cancel();
    EXPECT_FALSE(limiter.wait(token));
}

// ============================================================================
// HttpEndpointChecker
// ============================================================================

class HttpEndpointCheckerTest : public ::testing::Test {
protected:
    std::shared_ptr<RoutingHttpClient> http_ = std::make_shared<RoutingHttpClient>();
    std::shared_ptr<FakeTcpConnector> tcp_ = std::make_shared<FakeTcpConnector>();

    HttpEndpointChecker makeChecker(bool tcpFallback = true) {
        CheckerOptions options;
        options.timeoutSeconds = 2;
        options.userAgent = "test-agent";
        options.tcpFallback = tcpFallback;
        return HttpEndpointChecker(http_, tcp_, options);
    }
};

TEST_F(HttpEndpointCheckerTest, Constructor_NullCollaboratorsThrow) {
    EXPECT_THROW(HttpEndpointChecker(nullptr, tcp_, CheckerOptions()), std::invalid_argument);
    EXPECT_THROW(HttpEndpointChecker(http_, nullptr, CheckerOptions()), std::invalid_argument);
}

TEST_F(HttpEndpointCheckerTest, HttpsAnswerWins) {
    http_->routes["https://www.example.com:443/"] = okResponse("", 301);
    auto result = makeChecker().check(EndpointTarget{"www.example.com", 443});

    EXPECT_TRUE(result.reachable);
    EXPECT_EQ(result.protocol, "https");
    EXPECT_EQ(result.statusCode, std::optional<int>(301));
    EXPECT_EQ(http_->urls.size(), 1u);
}

TEST_F(HttpEndpointCheckerTest, ErrorStatusStillReachable) {
    http_->routes["https://www.example.com:8443/"] = okResponse("", 503);
    auto result = makeChecker().check(EndpointTarget{"www.example.com", 8443});
    EXPECT_TRUE(result.reachable);
    EXPECT_EQ(result.statusCode, std::optional<int>(503));
}

TEST_F(HttpEndpointCheckerTest, FallsBackToHttp) {
    http_->routes["http://www.example.com:80/"] = okResponse("");
    auto result = makeChecker().check(EndpointTarget{"www.example.com", 80});

    EXPECT_TRUE(result.reachable);
    EXPECT_EQ(result.protocol, "http");
    ASSERT_EQ(http_->urls.size(), 2u);
    EXPECT_EQ(http_->urls[0], "https://www.example.com:80/");
}

TEST_F(HttpEndpointCheckerTest, FallsBackToTcp) {
    tcp_->open = {"mail.example.com:8443"};
    auto result = makeChecker().check(EndpointTarget{"mail.example.com", 8443});

    EXPECT_TRUE(result.reachable);
    EXPECT_EQ(result.protocol, "tcp");
    EXPECT_FALSE(result.statusCode.has_value());
}

TEST_F(HttpEndpointCheckerTest, AllAttemptsFail) {
    auto result = makeChecker().check(EndpointTarget{"down.example.com", 443});

    EXPECT_FALSE(result.reachable);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("https: connection refused"), std::string::npos);
    EXPECT_NE(result.error->find("http: connection refused"), std::string::npos);
    EXPECT_NE(result.error->find("tcp: Connection refused"), std::string::npos);
}

TEST_F(HttpEndpointCheckerTest, TcpFallbackDisabled) {
    tcp_->open = {"down.example.com:443"};
    auto result = makeChecker(false).check(EndpointTarget{"down.example.com", 443});

    EXPECT_FALSE(result.reachable);
    EXPECT_EQ(tcp_->calls, 0);
    EXPECT_EQ(result.error->find("tcp:"), std::string::npos);
}
