#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace tollgate {

using Seconds = std::chrono::duration<double>;

enum class Priority {
    High,
    Normal,
    Low
};

enum class BackoffStrategy {
    Linear,
    Exponential,
    Fibonacci
};

const char* to_string(Priority priority);
const char* to_string(BackoffStrategy strategy);
Priority parse_priority(const std::string& name);
BackoffStrategy parse_backoff_strategy(const std::string& name);

// Limits and timeouts of the pooled HTTP client
struct ClientLimits {
    int max_connections = 10;
    int max_keepalive_connections = 5;
    Seconds keepalive_expiry{30.0};
    Seconds connect_timeout{10.0};
    Seconds read_timeout{30.0};
    Seconds write_timeout{10.0};
    Seconds pool_timeout{5.0};
    bool prefer_http2 = true;
    bool verify_tls = true;
    bool compression = true;
    std::string user_agent = "tollgate/1.0";
};

struct CacheConfig {
    bool enabled = true;
    size_t max_size_bytes = 50 * 1024 * 1024;
    Seconds default_ttl{300.0};
    Seconds max_age{3600.0};
};

struct BatchConfig {
    bool enabled = true;
    size_t max_batch_size = 50;
    Seconds batch_timeout{0.5};
    Seconds batch_max_wait{2.0};
};

struct RateLimitConfig {
    int max_requests_per_window = 80;
    Seconds window{10.0};
    int burst_limit = 20;
    Seconds burst_window{2.0};

    BackoffStrategy backoff_strategy = BackoffStrategy::Exponential;
    Seconds min_backoff{0.1};
    Seconds max_backoff{60.0};
    double backoff_multiplier = 2.0;

    bool jitter_enabled = true;

    // Minimum spacing between consecutive requests, per priority class
    Seconds high_priority_interval{0.05};
    Seconds normal_priority_interval{0.1};
    Seconds low_priority_interval{0.2};

    bool adaptive_enabled = true;
    Seconds adaptive_interval{300.0};
    size_t adaptive_min_samples = 10;
    int adaptive_step = 5;
    int adaptive_ceiling = 100;
    int adaptive_floor = 20;
    int adaptive_decrease_threshold = 3;
};

struct OptimizerConfig {
    ClientLimits connection;
    CacheConfig cache;
    BatchConfig batch;
    RateLimitConfig rate_limit;

    bool dedup_enabled = true;
    bool rate_limiting_enabled = true;
    bool metrics_enabled = true;
    Seconds slow_request_threshold{5.0};
    std::string log_level = "info";
};

// Reads a JSON config file. Missing keys keep their defaults.
OptimizerConfig load_config(const std::string& path);

// Overlays TOLLGATE_* environment variables onto |config|.
void apply_env_overrides(OptimizerConfig& config);

// Throws ConfigError describing the first invalid setting.
void validate(const OptimizerConfig& config);

void from_json(const nlohmann::json& j, OptimizerConfig& config);
void to_json(nlohmann::json& j, const OptimizerConfig& config);

} // namespace tollgate
