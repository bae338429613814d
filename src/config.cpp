#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace tollgate {

const char* to_string(Priority priority) {
    switch (priority) {
        case Priority::High:   return "high";
        case Priority::Normal: return "normal";
        case Priority::Low:    return "low";
    }
    return "normal";
}

const char* to_string(BackoffStrategy strategy) {
    switch (strategy) {
        case BackoffStrategy::Linear:      return "linear";
        case BackoffStrategy::Exponential: return "exponential";
        case BackoffStrategy::Fibonacci:   return "fibonacci";
    }
    return "exponential";
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Priority parse_priority(const std::string& name) {
    auto lower = lowercase(name);
    if (lower == "high") return Priority::High;
    if (lower == "normal") return Priority::Normal;
    if (lower == "low") return Priority::Low;
    throw ConfigError("unknown priority '" + name + "'");
}

BackoffStrategy parse_backoff_strategy(const std::string& name) {
    auto lower = lowercase(name);
    if (lower == "linear") return BackoffStrategy::Linear;
    if (lower == "exponential") return BackoffStrategy::Exponential;
    if (lower == "fibonacci") return BackoffStrategy::Fibonacci;
    throw ConfigError("unknown backoff strategy '" + name + "'");
}

// ──────────────────────────────────────────────────────────────────────────────
// JSON mapping. Durations are plain numbers of seconds.
// ──────────────────────────────────────────────────────────────────────────────

template <typename T>
static void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

static void read_seconds(const nlohmann::json& j, const char* key, Seconds& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = Seconds(it->get<double>());
    }
}

void from_json(const nlohmann::json& j, OptimizerConfig& config) {
    if (auto it = j.find("connection"); it != j.end()) {
        auto& c = config.connection;
        read_field(*it, "max_connections", c.max_connections);
        read_field(*it, "max_keepalive_connections", c.max_keepalive_connections);
        read_seconds(*it, "keepalive_expiry", c.keepalive_expiry);
        read_seconds(*it, "connect_timeout", c.connect_timeout);
        read_seconds(*it, "read_timeout", c.read_timeout);
        read_seconds(*it, "write_timeout", c.write_timeout);
        read_seconds(*it, "pool_timeout", c.pool_timeout);
        read_field(*it, "prefer_http2", c.prefer_http2);
        read_field(*it, "verify_tls", c.verify_tls);
        read_field(*it, "compression", c.compression);
        read_field(*it, "user_agent", c.user_agent);
    }

    if (auto it = j.find("cache"); it != j.end()) {
        auto& c = config.cache;
        read_field(*it, "enabled", c.enabled);
        if (auto mb = it->find("max_size_mb"); mb != it->end()) {
            c.max_size_bytes = static_cast<size_t>(mb->get<double>() * 1024 * 1024);
        }
        read_field(*it, "max_size_bytes", c.max_size_bytes);
        read_seconds(*it, "default_ttl", c.default_ttl);
        read_seconds(*it, "max_age", c.max_age);
    }

    if (auto it = j.find("batch"); it != j.end()) {
        auto& b = config.batch;
        read_field(*it, "enabled", b.enabled);
        read_field(*it, "max_batch_size", b.max_batch_size);
        read_seconds(*it, "batch_timeout", b.batch_timeout);
        read_seconds(*it, "batch_max_wait", b.batch_max_wait);
    }

    if (auto it = j.find("rate_limit"); it != j.end()) {
        auto& r = config.rate_limit;
        read_field(*it, "max_requests_per_window", r.max_requests_per_window);
        read_seconds(*it, "window", r.window);
        read_field(*it, "burst_limit", r.burst_limit);
        read_seconds(*it, "burst_window", r.burst_window);
        if (auto s = it->find("backoff_strategy"); s != it->end()) {
            r.backoff_strategy = parse_backoff_strategy(s->get<std::string>());
        }
        read_seconds(*it, "min_backoff", r.min_backoff);
        read_seconds(*it, "max_backoff", r.max_backoff);
        read_field(*it, "backoff_multiplier", r.backoff_multiplier);
        read_field(*it, "jitter_enabled", r.jitter_enabled);
        read_seconds(*it, "high_priority_interval", r.high_priority_interval);
        read_seconds(*it, "normal_priority_interval", r.normal_priority_interval);
        read_seconds(*it, "low_priority_interval", r.low_priority_interval);
        read_field(*it, "adaptive_enabled", r.adaptive_enabled);
        read_seconds(*it, "adaptive_interval", r.adaptive_interval);
        read_field(*it, "adaptive_min_samples", r.adaptive_min_samples);
        read_field(*it, "adaptive_step", r.adaptive_step);
        read_field(*it, "adaptive_ceiling", r.adaptive_ceiling);
        read_field(*it, "adaptive_floor", r.adaptive_floor);
        read_field(*it, "adaptive_decrease_threshold", r.adaptive_decrease_threshold);
    }

    read_field(j, "dedup_enabled", config.dedup_enabled);
    read_field(j, "rate_limiting_enabled", config.rate_limiting_enabled);
    read_field(j, "metrics_enabled", config.metrics_enabled);
    read_seconds(j, "slow_request_threshold", config.slow_request_threshold);
    read_field(j, "log_level", config.log_level);
}

void to_json(nlohmann::json& j, const OptimizerConfig& config) {
    const auto& c = config.connection;
    const auto& r = config.rate_limit;
    j = nlohmann::json{
        {"connection", {
            {"max_connections", c.max_connections},
            {"max_keepalive_connections", c.max_keepalive_connections},
            {"keepalive_expiry", c.keepalive_expiry.count()},
            {"connect_timeout", c.connect_timeout.count()},
            {"read_timeout", c.read_timeout.count()},
            {"write_timeout", c.write_timeout.count()},
            {"pool_timeout", c.pool_timeout.count()},
            {"prefer_http2", c.prefer_http2},
            {"verify_tls", c.verify_tls},
            {"compression", c.compression},
            {"user_agent", c.user_agent},
        }},
        {"cache", {
            {"enabled", config.cache.enabled},
            {"max_size_bytes", config.cache.max_size_bytes},
            {"default_ttl", config.cache.default_ttl.count()},
            {"max_age", config.cache.max_age.count()},
        }},
        {"batch", {
            {"enabled", config.batch.enabled},
            {"max_batch_size", config.batch.max_batch_size},
            {"batch_timeout", config.batch.batch_timeout.count()},
            {"batch_max_wait", config.batch.batch_max_wait.count()},
        }},
        {"rate_limit", {
            {"max_requests_per_window", r.max_requests_per_window},
            {"window", r.window.count()},
            {"burst_limit", r.burst_limit},
            {"burst_window", r.burst_window.count()},
            {"backoff_strategy", to_string(r.backoff_strategy)},
            {"min_backoff", r.min_backoff.count()},
            {"max_backoff", r.max_backoff.count()},
            {"backoff_multiplier", r.backoff_multiplier},
            {"jitter_enabled", r.jitter_enabled},
            {"adaptive_enabled", r.adaptive_enabled},
            {"adaptive_interval", r.adaptive_interval.count()},
        }},
        {"dedup_enabled", config.dedup_enabled},
        {"rate_limiting_enabled", config.rate_limiting_enabled},
        {"metrics_enabled", config.metrics_enabled},
        {"slow_request_threshold", config.slow_request_threshold.count()},
        {"log_level", config.log_level},
    };
}

OptimizerConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file " + path);
    }

    OptimizerConfig config;
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        config = j.get<OptimizerConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("invalid config file " + path + ": " + e.what());
    }

    logging::debug("loaded configuration from ", path);
    return config;
}

// ──────────────────────────────────────────────────────────────────────────────
// Environment overrides
// ──────────────────────────────────────────────────────────────────────────────

static const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

static long env_long(const char* name, const char* value) {
    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (end == value || *end != '\0') {
        throw ConfigError(std::string(name) + " must be an integer, got '" + value + "'");
    }
    return parsed;
}

static double env_double(const char* name, const char* value) {
    char* end = nullptr;
    double parsed = std::strtod(value, &end);
    if (end == value || *end != '\0') {
        throw ConfigError(std::string(name) + " must be a number, got '" + value + "'");
    }
    return parsed;
}

static bool env_bool(const char* name, const char* value) {
    auto lower = lowercase(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw ConfigError(std::string(name) + " must be a boolean, got '" + value + "'");
}

void apply_env_overrides(OptimizerConfig& config) {
    if (auto v = env("TOLLGATE_MAX_CONNECTIONS")) {
        config.connection.max_connections =
            static_cast<int>(env_long("TOLLGATE_MAX_CONNECTIONS", v));
    }
    if (auto v = env("TOLLGATE_CACHE_MAX_SIZE_MB")) {
        config.cache.max_size_bytes =
            static_cast<size_t>(env_double("TOLLGATE_CACHE_MAX_SIZE_MB", v) * 1024 * 1024);
    }
    if (auto v = env("TOLLGATE_CACHE_TTL_SECONDS")) {
        config.cache.default_ttl = Seconds(env_double("TOLLGATE_CACHE_TTL_SECONDS", v));
    }
    if (auto v = env("TOLLGATE_RATE_LIMIT_MAX_REQUESTS")) {
        config.rate_limit.max_requests_per_window =
            static_cast<int>(env_long("TOLLGATE_RATE_LIMIT_MAX_REQUESTS", v));
    }
    if (auto v = env("TOLLGATE_RATE_LIMIT_WINDOW_SECONDS")) {
        config.rate_limit.window = Seconds(env_double("TOLLGATE_RATE_LIMIT_WINDOW_SECONDS", v));
    }
    if (auto v = env("TOLLGATE_BURST_LIMIT")) {
        config.rate_limit.burst_limit = static_cast<int>(env_long("TOLLGATE_BURST_LIMIT", v));
    }
    if (auto v = env("TOLLGATE_BACKOFF_STRATEGY")) {
        config.rate_limit.backoff_strategy = parse_backoff_strategy(v);
    }
    if (auto v = env("TOLLGATE_DEDUP_ENABLED")) {
        config.dedup_enabled = env_bool("TOLLGATE_DEDUP_ENABLED", v);
    }
    if (auto v = env("TOLLGATE_BATCH_ENABLED")) {
        config.batch.enabled = env_bool("TOLLGATE_BATCH_ENABLED", v);
    }
    if (auto v = env("TOLLGATE_CACHE_ENABLED")) {
        config.cache.enabled = env_bool("TOLLGATE_CACHE_ENABLED", v);
    }
    if (auto v = env("TOLLGATE_LOG_LEVEL")) {
        logging::parse_level(v);
        config.log_level = v;
    }
}

void validate(const OptimizerConfig& config) {
    const auto& c = config.connection;
    if (c.max_connections < 1) {
        throw ConfigError("connection.max_connections must be at least 1");
    }
    if (c.max_keepalive_connections < 0 || c.max_keepalive_connections > c.max_connections) {
        throw ConfigError("connection.max_keepalive_connections must be within [0, max_connections]");
    }
    if (c.connect_timeout.count() <= 0 || c.read_timeout.count() <= 0 ||
        c.write_timeout.count() <= 0 || c.pool_timeout.count() <= 0) {
        throw ConfigError("connection timeouts must be positive");
    }

    if (config.cache.max_size_bytes == 0) {
        throw ConfigError("cache.max_size_bytes must be positive");
    }
    if (config.cache.default_ttl.count() <= 0 || config.cache.max_age.count() <= 0) {
        throw ConfigError("cache TTLs must be positive");
    }

    if (config.batch.max_batch_size < 1) {
        throw ConfigError("batch.max_batch_size must be at least 1");
    }
    if (config.batch.batch_timeout.count() < 0 || config.batch.batch_max_wait.count() <= 0) {
        throw ConfigError("batch timeouts must be positive");
    }

    const auto& r = config.rate_limit;
    if (r.max_requests_per_window < 1 || r.burst_limit < 1) {
        throw ConfigError("rate_limit request limits must be at least 1");
    }
    if (r.window.count() <= 0 || r.burst_window.count() <= 0) {
        throw ConfigError("rate_limit windows must be positive");
    }
    if (r.min_backoff.count() <= 0 || r.min_backoff > r.max_backoff) {
        throw ConfigError("rate_limit.min_backoff must be within (0, max_backoff]");
    }
    if (r.backoff_multiplier < 1.0) {
        throw ConfigError("rate_limit.backoff_multiplier must be >= 1");
    }
    if (r.adaptive_floor > r.adaptive_ceiling) {
        throw ConfigError("rate_limit.adaptive_floor must not exceed adaptive_ceiling");
    }

    logging::parse_level(config.log_level);
}

} // namespace tollgate
