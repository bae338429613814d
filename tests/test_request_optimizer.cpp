#include "errors.hpp"
#include "loopback_server.hpp"
#include "request_optimizer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <sstream>
#include <thread>
#include <vector>

using namespace tollgate;
using nlohmann::json;
using tollgate::test_support::LoopbackServer;
using tollgate::test_support::ReceivedRequest;

namespace {

// Fast limiter, quiet logs
OptimizerConfig test_config() {
    OptimizerConfig config;
    config.rate_limit.jitter_enabled = false;
    config.rate_limit.high_priority_interval = Seconds(0);
    config.rate_limit.normal_priority_interval = Seconds(0);
    config.rate_limit.low_priority_interval = Seconds(0);
    config.rate_limit.adaptive_enabled = false;
    config.connection.read_timeout = Seconds(2.0);
    config.batch.batch_timeout = Seconds(0.05);
    config.log_level = "error";
    return config;
}

Response canned(int status, const std::string& body,
                std::map<std::string, std::string> headers = {}) {
    Response resp;
    resp.status_code = status;
    resp.body = body;
    resp.headers = std::move(headers);
    resp.bytes_received = body.size();
    return resp;
}

RequestDescriptor get(const std::string& url) {
    RequestDescriptor d;
    d.method = "GET";
    d.url = url;
    return d;
}

} // namespace

TEST(RequestOptimizerTest, CachedGetSkipsTheNetwork) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::json(200, R"({"id": 1, "state": "open"})");
    });
    RequestOptimizer optimizer(test_config());

    RequestDescriptor d = get(server.url("/conversations/1"));
    d.cache_key = "conv:1";
    d.cache_ttl = Seconds(60.0);

    json first = optimizer.perform_request(d);
    json second = optimizer.perform_request(d);

    EXPECT_EQ(first["state"], "open");
    EXPECT_EQ(first, second);
    EXPECT_EQ(server.requests().size(), 1u);

    OptimizerStats stats = optimizer.stats();
    EXPECT_EQ(stats.requests.total_requests, 2u);
    EXPECT_EQ(stats.requests.network_requests, 1u);
    EXPECT_EQ(stats.requests.cached_responses, 1u);
    EXPECT_DOUBLE_EQ(stats.requests.cache_hit_ratio, 0.5);
    EXPECT_EQ(stats.cache.entries, 1u);
    ASSERT_TRUE(stats.rate_limiter.has_value());
    EXPECT_EQ(stats.rate_limiter->total_requests, 1u);
}

TEST(RequestOptimizerTest, PostSendsJsonAndIsNeverCached) {
    LoopbackServer server([](const ReceivedRequest& req) {
        return LoopbackServer::json(201, req.body);
    });
    RequestOptimizer optimizer(test_config());

    RequestDescriptor d;
    d.method = "post";
    d.url = server.url("/conversations/search");
    d.body = {{"query", {{"field", "state"}, {"value", "open"}}}};
    d.cache_key = "search";

    json result = optimizer.perform_request(d);
    EXPECT_EQ(result, d.body);
    optimizer.perform_request(d);

    auto received = server.requests();
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].method, "POST");
    EXPECT_EQ(received[0].header("content-type"), "application/json");
    EXPECT_EQ(json::parse(received[0].body), d.body);
    EXPECT_EQ(optimizer.stats().cache.entries, 0u);
}

TEST(RequestOptimizerTest, GetBodyBecomesQueryParameters) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::json(200, "[]");
    });
    RequestOptimizer optimizer(test_config());

    RequestDescriptor d = get(server.url("/contacts?sort=asc"));
    d.body = {{"email", "a b@example.com"}, {"per_page", 50}};
    optimizer.perform_request(d);

    auto received = server.requests();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].target, "/contacts?sort=asc&email=a%20b%40example.com&per_page=50");
    EXPECT_TRUE(received[0].body.empty());
}

TEST(RequestOptimizerTest, NonSuccessStatusRaises) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::json(404, R"({"error": "not found"})");
    });
    RequestOptimizer optimizer(test_config());

    RequestDescriptor d = get(server.url("/missing"));
    d.cache_key = "missing";
    try {
        optimizer.perform_request(d);
        FAIL() << "expected HttpStatusError";
    } catch (const HttpStatusError& e) {
        EXPECT_EQ(e.status_code(), 404);
        EXPECT_FALSE(e.is_rate_limited());
        EXPECT_NE(e.body().find("not found"), std::string::npos);
    }

    OptimizerStats stats = optimizer.stats();
    EXPECT_EQ(stats.cache.entries, 0u);
    EXPECT_EQ(stats.requests.total_errors, 1u);
    EXPECT_EQ(stats.requests.error_counts["http_404"], 1u);
}

TEST(RequestOptimizerTest, TooManyRequestsFeedsTheLimiter) {
    RequestOptimizer optimizer(test_config(), [](HttpClient&, const Request&) {
        return canned(429, "{}", {{"retry-after", "2"}});
    });

    try {
        optimizer.perform_request(get("http://api.example.com/conversations"));
        FAIL() << "expected HttpStatusError";
    } catch (const HttpStatusError& e) {
        EXPECT_TRUE(e.is_rate_limited());
        ASSERT_TRUE(e.retry_after().has_value());
        EXPECT_DOUBLE_EQ(e.retry_after()->count(), 2.0);
    }

    ASSERT_NE(optimizer.rate_limiter(), nullptr);
    EXPECT_DOUBLE_EQ(optimizer.rate_limiter()->current_backoff().count(), 2.0);
    EXPECT_EQ(optimizer.stats().rate_limiter->rate_limit_hits, 1u);
}

TEST(RequestOptimizerTest, BodyParsing) {
    std::string body;
    RequestOptimizer optimizer(test_config(), [&](HttpClient&, const Request&) {
        return canned(200, body);
    });

    body = "";
    EXPECT_TRUE(optimizer.perform_request(get("http://h/empty")).is_null());

    body = "<html>oops</html>";
    EXPECT_THROW(optimizer.perform_request(get("http://h/html")), ResponseParseError);
    EXPECT_EQ(optimizer.stats().requests.error_counts["parse"], 1u);
}

TEST(RequestOptimizerTest, ConcurrentIdenticalGetsCollapse) {
    std::atomic<int> calls{0};
    RequestOptimizer optimizer(test_config(), [&](HttpClient&, const Request&) {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return canned(200, R"({"page": 1})");
    });

    std::vector<json> results(10);
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&, i] {
            RequestDescriptor d = get("http://api.example.com/conversations");
            d.headers["Authorization"] = "Bearer " + std::to_string(i);
            results[i] = optimizer.perform_request(d);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(calls.load(), 1);
    for (const auto& r : results) {
        EXPECT_EQ(r["page"], 1);
    }

    OptimizerStats stats = optimizer.stats();
    EXPECT_EQ(stats.dedup.deduplicated, 9u);
    EXPECT_EQ(stats.requests.deduplicated_requests, 9u);
    EXPECT_EQ(stats.requests.network_requests, 1u);
}

TEST(RequestOptimizerTest, CollapsedFailureReachesEveryCaller) {
    std::atomic<int> calls{0};
    RequestOptimizer optimizer(test_config(), [&](HttpClient&, const Request&) -> Response {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        throw TransportError(TransportErrorKind::ReadTimeout, "api.example.com");
    });

    std::atomic<int> timeouts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&] {
            try {
                optimizer.perform_request(get("http://api.example.com/slow"));
            } catch (const TransportError& e) {
                if (e.kind() == TransportErrorKind::ReadTimeout) ++timeouts;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(timeouts.load(), 10);
    EXPECT_EQ(optimizer.stats().requests.error_counts["read timeout"], 1u);
}

TEST(RequestOptimizerTest, DedupDisabledSendsEveryRequest) {
    OptimizerConfig config = test_config();
    config.dedup_enabled = false;
    std::atomic<int> calls{0};
    RequestOptimizer optimizer(config, [&](HttpClient&, const Request&) {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return canned(200, "1");
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] { optimizer.perform_request(get("http://h/x")); });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(calls.load(), 4);
}

TEST(RequestOptimizerTest, BatchedItemsGetTheirOwnResults) {
    RequestOptimizer optimizer(test_config());
    auto square = [](const std::vector<json>& items) {
        std::vector<json> out;
        for (const auto& item : items) out.push_back(item.get<int>() * item.get<int>());
        return out;
    };

    std::vector<json> results(5);
    std::vector<std::thread> threads;
    for (int i = 0; i < 5; ++i) {
        threads.emplace_back([&, i] { results[i] = optimizer.perform_batched("squares", i, square); });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(results[i], json(i * i));
    }
    EXPECT_EQ(optimizer.stats().requests.batched_requests, 5u);
}

TEST(RequestOptimizerTest, InvalidateCacheByPattern) {
    RequestOptimizer optimizer(test_config(), [](HttpClient&, const Request& req) {
        return canned(200, json{{"url", req.url}}.dump());
    });

    for (const char* key : {"conv:1", "conv:2", "msg:1"}) {
        RequestDescriptor d = get(std::string("http://h/") + key);
        d.cache_key = key;
        optimizer.perform_request(d);
    }

    EXPECT_EQ(optimizer.invalidate_cache(std::string("conv")), 2u);
    EXPECT_EQ(optimizer.stats().cache.entries, 1u);
    EXPECT_EQ(optimizer.invalidate_cache(), 1u);
}

TEST(RequestOptimizerTest, StatsAreStableWithoutActivity) {
    RequestOptimizer optimizer(test_config(), [](HttpClient&, const Request&) {
        return canned(200, "{}");
    });
    optimizer.perform_request(get("http://h/a"));

    json first = optimizer.stats();
    json second = optimizer.stats();
    EXPECT_EQ(first, second);
    EXPECT_EQ(first["requests"]["total_requests"], 1);
    EXPECT_EQ(first["optimizations"]["request_deduplication"], true);
}

TEST(RequestOptimizerTest, ReportsAreForwardedToTheLimiter) {
    RequestOptimizer optimizer(test_config());
    optimizer.report_rate_limit_hit();
    optimizer.report_rate_limit_hit();
    EXPECT_DOUBLE_EQ(optimizer.rate_limiter()->current_backoff().count(), 0.4);

    optimizer.report_success(Seconds(0.1));
    EXPECT_DOUBLE_EQ(optimizer.rate_limiter()->current_backoff().count(), 0.1);
}

TEST(RequestOptimizerTest, RateLimitingCanBeDisabled) {
    OptimizerConfig config = test_config();
    config.rate_limiting_enabled = false;
    RequestOptimizer optimizer(config, [](HttpClient&, const Request&) {
        return canned(200, "{}");
    });

    EXPECT_EQ(optimizer.rate_limiter(), nullptr);
    optimizer.report_rate_limit_hit();
    optimizer.perform_request(get("http://h/a"));

    OptimizerStats stats = optimizer.stats();
    EXPECT_FALSE(stats.rate_limiter.has_value());
    EXPECT_FALSE(stats.rate_limiting);
}

TEST(RequestOptimizerTest, ResetStatsClearsCounters) {
    RequestOptimizer optimizer(test_config(), [](HttpClient&, const Request&) {
        return canned(200, "{}");
    });
    optimizer.perform_request(get("http://h/a"));
    optimizer.reset_stats();

    OptimizerStats stats = optimizer.stats();
    EXPECT_EQ(stats.requests.total_requests, 0u);
    EXPECT_EQ(stats.dedup.leaders, 0u);
}

TEST(RequestOptimizerTest, PrintsBoxedReport) {
    RequestOptimizer optimizer(test_config(), [](HttpClient&, const Request&) {
        return canned(200, "{}");
    });
    optimizer.perform_request(get("http://h/a"));

    std::ostringstream out;
    optimizer.print_stats(out);
    std::string text = out.str();
    EXPECT_NE(text.find("Requests"), std::string::npos);
    EXPECT_NE(text.find("Rate limiter"), std::string::npos);
    EXPECT_NE(text.find("p99"), std::string::npos);
    EXPECT_EQ(text.find('\033'), std::string::npos);
}

TEST(RequestOptimizerTest, InvalidConfigurationIsRejected) {
    OptimizerConfig config = test_config();
    config.connection.max_connections = 0;
    EXPECT_THROW(RequestOptimizer{config}, ConfigError);
}

TEST(RequestOptimizerTest, CloseIsIdempotent) {
    RequestOptimizer optimizer(test_config());
    optimizer.close();
    optimizer.close();
    EXPECT_THROW(optimizer.perform_batched("k", 1, [](const std::vector<json>& items) { return items; }),
                 BatchError);
}
