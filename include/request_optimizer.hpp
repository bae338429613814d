#pragma once

#include "config.hpp"
#include "connection_manager.hpp"
#include "http_client.hpp"
#include "rate_limiter.hpp"
#include "request_batcher.hpp"
#include "request_deduplicator.hpp"
#include "response_cache.hpp"
#include "stats.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tollgate {

struct RequestDescriptor {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;

    // JSON payload for POST/PUT/PATCH, query parameters (object) otherwise
    nlohmann::json body;

    std::optional<std::string> cache_key;
    std::optional<Seconds> cache_ttl;
    Priority priority = Priority::Normal;
    std::optional<Seconds> timeout;
};

// The physical call. Defaults to HttpClient::request.
using RequestExecutor = std::function<Response(HttpClient&, const Request&)>;

struct OptimizerStats {
    RequestMetrics requests;
    CacheStats cache;
    DedupStats dedup;
    BatchStats batch;
    PoolStats connections;
    uint64_t clients_created = 0;
    std::optional<RateLimiterStats> rate_limiter;

    bool caching = false;
    bool connection_pooling = true;
    bool request_batching = false;
    bool request_deduplication = false;
    bool compression = false;
    bool rate_limiting = false;

    std::vector<std::string> recommendations;
};

void to_json(nlohmann::json& j, const OptimizerStats& stats);

// Sits between callers and a rate-limited JSON API: response cache,
// request deduplication, batching, admission control and a pooled client.
class RequestOptimizer {
public:
    // Validates |config| (ConfigError) and applies its log level
    explicit RequestOptimizer(const OptimizerConfig& config = OptimizerConfig(),
                              RequestExecutor executor = nullptr,
                              ConnectionManager::ClientFactory client_factory = nullptr);
    ~RequestOptimizer();

    RequestOptimizer(const RequestOptimizer&) = delete;
    RequestOptimizer& operator=(const RequestOptimizer&) = delete;

    // Parsed JSON body (null when empty). Throws HttpStatusError,
    // ResponseParseError, DedupWaitTimeout or the TransportError as raised.
    nlohmann::json perform_request(const RequestDescriptor& request);

    nlohmann::json perform_batched(const std::string& batch_key,
                                   nlohmann::json item,
                                   RequestBatcher::Executor execute);

    void report_success(Seconds response_time);
    void report_rate_limit_hit(std::optional<Seconds> retry_after = std::nullopt);

    size_t invalidate_cache(const std::optional<std::string>& pattern = std::nullopt);

    OptimizerStats stats() const;
    void print_stats(std::ostream& out, bool colored = false) const;
    void reset_stats();

    // Stops the batcher and closes the client. Idempotent.
    void close();

    const OptimizerConfig& config() const { return config_; }

    // nullptr when rate limiting is disabled
    AdaptiveRateLimiter* rate_limiter() { return limiter_.get(); }

private:
    nlohmann::json execute_network(const RequestDescriptor& descriptor);
    Request build_request(const RequestDescriptor& descriptor) const;
    std::vector<std::string> recommendations(const OptimizerStats& stats) const;

    OptimizerConfig config_;
    RequestExecutor executor_;
    Statistics metrics_;
    ResponseCache cache_;
    RequestDeduplicator dedup_;
    RequestBatcher batcher_;
    std::unique_ptr<AdaptiveRateLimiter> limiter_;
    ConnectionManager connections_;
};

} // namespace tollgate
