#include "request_optimizer.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace tollgate {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool is_idempotent(const std::string& method) {
    return method == "GET" || method == "HEAD";
}

bool has_body(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

bool has_header(const std::map<std::string, std::string>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first.size() != name.size()) continue;
        bool same = std::equal(h.first.begin(), h.first.end(), name.begin(),
                               [](char a, char b) {
                                   return std::tolower(static_cast<unsigned char>(a)) ==
                                          std::tolower(static_cast<unsigned char>(b));
                               });
        if (same) return true;
    }
    return false;
}

std::string url_encode(const std::string& s) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string query_value(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    return value.dump();
}

// Seconds form only; HTTP-date values are ignored
std::optional<Seconds> parse_retry_after(const std::string& value) {
    if (value.empty()) return std::nullopt;

    char* end = nullptr;
    double seconds = std::strtod(value.c_str(), &end);
    if (end == value.c_str() || !std::isfinite(seconds) || seconds < 0) {
        return std::nullopt;
    }
    return Seconds(seconds);
}

Response default_executor(HttpClient& client, const Request& request) {
    return client.request(request);
}

} // namespace

void to_json(nlohmann::json& j, const OptimizerStats& s) {
    j = nlohmann::json{
        {"requests", s.requests},
        {"cache", s.cache},
        {"deduplication", {
            {"leaders", s.dedup.leaders},
            {"deduplicated", s.dedup.deduplicated},
            {"wait_timeouts", s.dedup.wait_timeouts},
            {"in_flight", s.dedup.in_flight}
        }},
        {"batching", s.batch},
        {"connections", {
            {"clients_created", s.clients_created},
            {"created", s.connections.created},
            {"reused", s.connections.reused},
            {"idle", s.connections.idle},
            {"in_use", s.connections.in_use},
            {"waits", s.connections.waits},
            {"timeouts", s.connections.timeouts}
        }},
        {"optimizations", {
            {"caching", s.caching},
            {"connection_pooling", s.connection_pooling},
            {"request_batching", s.request_batching},
            {"request_deduplication", s.request_deduplication},
            {"compression", s.compression},
            {"rate_limiting", s.rate_limiting}
        }},
        {"recommendations", s.recommendations}
    };
    if (s.rate_limiter) {
        j["rate_limiting"] = *s.rate_limiter;
    } else {
        j["rate_limiting"] = nullptr;
    }
}

RequestOptimizer::RequestOptimizer(const OptimizerConfig& config,
                                   RequestExecutor executor,
                                   ConnectionManager::ClientFactory client_factory)
    : config_((validate(config), config)),
      executor_(executor ? std::move(executor) : RequestExecutor(default_executor)),
      cache_(config_.cache),
      batcher_(config_.batch),
      connections_(config_.connection, std::move(client_factory)) {
    logging::set_level(logging::parse_level(config_.log_level));

    if (config_.rate_limiting_enabled) {
        limiter_ = std::make_unique<AdaptiveRateLimiter>(config_.rate_limit);
    }

    logging::debug("optimizer ready (cache=", config_.cache.enabled ? "on" : "off",
                   ", dedup=", config_.dedup_enabled ? "on" : "off",
                   ", batch=", config_.batch.enabled ? "on" : "off",
                   ", rate_limit=", limiter_ ? "on" : "off", ")");
}

RequestOptimizer::~RequestOptimizer() {
    close();
}

Request RequestOptimizer::build_request(const RequestDescriptor& d) const {
    Request req;
    req.method = to_upper(d.method);
    req.url = d.url;
    req.headers = d.headers;
    req.timeout = d.timeout;

    if (d.body.is_null()) {
        return req;
    }

    if (has_body(req.method)) {
        req.body = d.body.dump();
        if (!has_header(req.headers, "Content-Type")) {
            req.headers["Content-Type"] = "application/json";
        }
        return req;
    }

    if (!d.body.is_object()) {
        throw Error("query parameters for " + req.method + " must be a JSON object");
    }

    std::string query;
    for (auto it = d.body.begin(); it != d.body.end(); ++it) {
        if (!query.empty()) query += '&';
        query += url_encode(it.key()) + "=" + url_encode(query_value(it.value()));
    }
    if (!query.empty()) {
        req.url += (req.url.find('?') == std::string::npos ? "?" : "&") + query;
    }
    return req;
}

nlohmann::json RequestOptimizer::execute_network(const RequestDescriptor& d) {
    Request req = build_request(d);

    if (limiter_) {
        limiter_->acquire(d.priority);
    }

    auto client = connections_.get_client();
    auto start = std::chrono::steady_clock::now();

    Response resp;
    try {
        resp = executor_(*client, req);
    } catch (const TransportError& e) {
        if (config_.metrics_enabled) metrics_.record_error(to_string(e.kind()));
        throw;
    } catch (const std::exception&) {
        if (config_.metrics_enabled) metrics_.record_error("other");
        throw;
    }

    Seconds elapsed = std::chrono::steady_clock::now() - start;

    if (!resp.ok()) {
        auto retry_after = parse_retry_after(resp.header("retry-after"));
        if (resp.status_code == 429 && limiter_) {
            limiter_->report_rate_limit_hit(retry_after);
        }
        if (config_.metrics_enabled) {
            metrics_.record_error("http_" + std::to_string(resp.status_code));
        }
        throw HttpStatusError(resp.status_code, req.url, resp.body, retry_after);
    }

    if (limiter_) {
        limiter_->report_success(elapsed);
    }

    nlohmann::json result;
    if (!resp.body.empty()) {
        try {
            result = nlohmann::json::parse(resp.body);
        } catch (const nlohmann::json::parse_error& e) {
            if (config_.metrics_enabled) metrics_.record_error("parse");
            throw ResponseParseError("invalid JSON from " + req.url + ": " + e.what());
        }
    }

    if (d.cache_key && is_idempotent(req.method)) {
        cache_.put(*d.cache_key, result, d.cache_ttl);
    }

    if (config_.metrics_enabled) {
        metrics_.record_response(elapsed, resp.bytes_received);
    }

    if (elapsed > config_.slow_request_threshold) {
        if (config_.metrics_enabled) metrics_.record_slow_request();
        logging::warn("slow request: ", req.method, " ", req.url, " took ",
                      ReportPrinter::fixed(elapsed.count(), 2, "s"));
    }

    return result;
}

nlohmann::json RequestOptimizer::perform_request(const RequestDescriptor& d) {
    std::string method = to_upper(d.method);
    bool idempotent = is_idempotent(method);

    if (d.cache_key && idempotent) {
        if (auto cached = cache_.get(*d.cache_key)) {
            if (config_.metrics_enabled) metrics_.record_cache_hit();
            logging::debug("cache hit: ", *d.cache_key);
            return *cached;
        }
    }

    if (!config_.dedup_enabled || !idempotent) {
        return execute_network(d);
    }

    std::string key = make_dedup_key(method, d.url, d.headers, d.body);
    bool produced = false;
    try {
        nlohmann::json result = dedup_.join(key, [&] {
            produced = true;
            return execute_network(d);
        }, d.timeout);
        if (!produced && config_.metrics_enabled) metrics_.record_deduplicated();
        return result;
    } catch (const std::exception&) {
        if (!produced && config_.metrics_enabled) metrics_.record_deduplicated();
        throw;
    }
}

nlohmann::json RequestOptimizer::perform_batched(const std::string& batch_key,
                                                 nlohmann::json item,
                                                 RequestBatcher::Executor execute) {
    nlohmann::json result = batcher_.enqueue(batch_key, std::move(item), std::move(execute));
    if (config_.metrics_enabled) metrics_.record_batched(1);
    return result;
}

void RequestOptimizer::report_success(Seconds response_time) {
    if (limiter_) limiter_->report_success(response_time);
}

void RequestOptimizer::report_rate_limit_hit(std::optional<Seconds> retry_after) {
    if (limiter_) limiter_->report_rate_limit_hit(retry_after);
}

size_t RequestOptimizer::invalidate_cache(const std::optional<std::string>& pattern) {
    return cache_.invalidate(pattern);
}

std::vector<std::string> RequestOptimizer::recommendations(const OptimizerStats& s) const {
    std::vector<std::string> out;
    const RequestMetrics& m = s.requests;

    if (s.rate_limiter) {
        out = s.rate_limiter->recommendations;
    }

    if (m.cache_hit_ratio < 0.3 && m.total_requests > 100) {
        out.push_back("Low cache hit ratio - consider increasing cache TTL or size");
    }
    if (m.avg_response_time_seconds > config_.slow_request_threshold.count()) {
        out.push_back("High average response time - check network or API performance");
    }
    if (m.total_requests > 0 &&
        static_cast<double>(m.deduplicated_requests) > m.total_requests * 0.1) {
        out.push_back("High request deduplication - consider request optimization");
    }
    if (s.cache.utilization_percent > 90.0) {
        out.push_back("Cache near capacity - consider increasing cache size");
    }
    if (s.rate_limiter && s.rate_limiter->efficiency_percent < 70.0) {
        out.push_back("API efficiency is low - consider reducing concurrent requests");
    }
    if (s.caching && m.total_requests > 0 && m.cache_hit_ratio < 0.2) {
        out.push_back("Low cache usage - verify cache keys and TTL settings");
    }
    return out;
}

OptimizerStats RequestOptimizer::stats() const {
    OptimizerStats s;
    s.requests = metrics_.snapshot();
    s.cache = cache_.stats();
    s.dedup = dedup_.stats();
    s.batch = batcher_.stats();
    s.connections = connections_.pool_stats();
    s.clients_created = connections_.clients_created();
    if (limiter_) {
        s.rate_limiter = limiter_->stats();
    }

    s.caching = config_.cache.enabled;
    s.request_batching = config_.batch.enabled;
    s.request_deduplication = config_.dedup_enabled;
    s.compression = config_.connection.compression;
    s.rate_limiting = limiter_ != nullptr;

    s.recommendations = recommendations(s);
    return s;
}

void RequestOptimizer::print_stats(std::ostream& out, bool colored) const {
    OptimizerStats s = stats();
    const RequestMetrics& m = s.requests;
    ReportPrinter p(out, colored);
    using F = ReportPrinter;

    p.title("tollgate statistics");

    p.begin_section("Requests");
    p.line("Total:", std::to_string(m.total_requests));
    p.line("Network:", std::to_string(m.network_requests));
    p.line("Cached:", std::to_string(m.cached_responses));
    p.line("Deduplicated:", std::to_string(m.deduplicated_requests));
    p.line("Batched:", std::to_string(m.batched_requests));
    p.line("Slow:", std::to_string(m.slow_requests));
    p.line("Errors:", std::to_string(m.total_errors));
    p.line("Received:", std::to_string(m.bytes_received) + " bytes", true);
    p.end_section();

    p.begin_section("Timing");
    p.line("Average:", F::fixed(m.avg_response_time_seconds * 1000.0, 1, " ms"));
    p.line("Fastest:", F::fixed(m.fastest_request_seconds * 1000.0, 1, " ms"));
    p.line("Slowest:", F::fixed(m.slowest_request_seconds * 1000.0, 1, " ms"), true);
    p.table({"p50", "p90", "p99"},
            {F::fixed(m.p50_seconds * 1000.0, 1, " ms"),
             F::fixed(m.p90_seconds * 1000.0, 1, " ms"),
             F::fixed(m.p99_seconds * 1000.0, 1, " ms")});
    p.end_section();

    p.begin_section("Cache");
    p.line("Enabled:", s.caching ? "yes" : "no");
    p.line("Entries:", std::to_string(s.cache.entries));
    p.line("Size:", F::fixed(s.cache.size_mb, 2, " MB"));
    p.line("Utilization:", F::fixed(s.cache.utilization_percent, 1, " %"));
    p.line("Hit ratio:", F::fixed(m.cache_hit_ratio * 100.0, 1, " %"));
    p.line("Evictions:", std::to_string(s.cache.evictions), true);
    p.end_section();

    p.begin_section("Connections");
    p.line("Clients created:", std::to_string(s.clients_created));
    p.line("Opened:", std::to_string(s.connections.created));
    p.line("Reused:", std::to_string(s.connections.reused));
    p.line("Idle / in use:", std::to_string(s.connections.idle) + " / " +
                             std::to_string(s.connections.in_use));
    p.line("Pool timeouts:", std::to_string(s.connections.timeouts), true);
    p.end_section();

    if (s.rate_limiter) {
        const RateLimiterStats& r = *s.rate_limiter;
        p.begin_section("Rate limiter");
        p.line("State:", to_string(r.regime));
        p.line("Window:", std::to_string(r.requests_in_window) + " / " +
                          std::to_string(r.max_requests_per_window) + " per " +
                          F::fixed(r.window_seconds, 0, "s"));
        p.line("Burst:", std::to_string(r.requests_in_burst_window) + " / " +
                         std::to_string(r.burst_limit));
        p.line("Backoff:", F::fixed(r.current_backoff_seconds, 2, "s") + " (" +
                           r.backoff_strategy + ")");
        p.line("Delayed:", std::to_string(r.requests_delayed) + " of " +
                           std::to_string(r.total_requests));
        p.line("Efficiency:", F::fixed(r.efficiency_percent, 1, " %"));
        p.line("Rate limit hits:", std::to_string(r.rate_limit_hits), true);
        p.end_section();
    }

    if (!s.recommendations.empty()) {
        p.begin_section("Recommendations");
        for (size_t i = 0; i < s.recommendations.size(); ++i) {
            p.line("•", s.recommendations[i], i + 1 == s.recommendations.size());
        }
        p.end_section();
    }
}

void RequestOptimizer::reset_stats() {
    metrics_.reset();
    dedup_.reset_stats();
    batcher_.reset_stats();
}

void RequestOptimizer::close() {
    batcher_.stop();
    connections_.close();
}

} // namespace tollgate
