#pragma once

#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace tollgate {

// Next backoff for the configured strategy. A positive server hint wins,
// clamped to [min_backoff, max_backoff].
struct BackoffPolicy {
    static Seconds next(const RateLimitConfig& config,
                        Seconds current,
                        std::optional<Seconds> server_hint = std::nullopt);
};

enum class RateRegime {
    Normal,
    BurstLimited,
    WindowLimited,
    BackingOff,
    Adapting
};

const char* to_string(RateRegime regime);

struct RateLimitMetrics {
    uint64_t total_requests = 0;
    uint64_t requests_delayed = 0;
    double total_delay_seconds = 0.0;
    uint64_t rate_limit_hits = 0;
    uint64_t backoff_events = 0;
    double avg_request_interval = 0.0;
    double current_rate_per_second = 0.0;
    uint64_t successes = 0;
    double total_response_time_seconds = 0.0;
};

struct RateLimiterStats {
    // configuration
    int max_requests_per_window = 0;
    double window_seconds = 0.0;
    int burst_limit = 0;
    std::string backoff_strategy;

    // current state
    size_t requests_in_window = 0;
    size_t requests_in_burst_window = 0;
    int consecutive_rate_limits = 0;
    double current_backoff_seconds = 0.0;
    double current_rate_per_second = 0.0;
    RateRegime regime = RateRegime::Normal;

    // performance
    uint64_t total_requests = 0;
    uint64_t requests_delayed = 0;
    double efficiency_percent = 100.0;
    double avg_delay_seconds = 0.0;
    uint64_t rate_limit_hits = 0;
    uint64_t backoff_events = 0;
    double avg_response_time_seconds = 0.0;

    std::vector<std::string> recommendations;
};

void to_json(nlohmann::json& j, const RateLimiterStats& stats);

// Client-side admission control: sliding window and burst caps, priority
// spacing, backoff after provider rate-limit signals, and a slow loop that
// retunes the window capacity from observed success intervals.
class AdaptiveRateLimiter {
public:
    using Observer = std::function<void(const RateLimitMetrics&)>;

    static constexpr size_t MAX_SUCCESS_SAMPLES = 100;
    static constexpr std::chrono::seconds SAMPLE_HORIZON{600};

    explicit AdaptiveRateLimiter(const RateLimitConfig& config);

    AdaptiveRateLimiter(const AdaptiveRateLimiter&) = delete;
    AdaptiveRateLimiter& operator=(const AdaptiveRateLimiter&) = delete;

    // Blocks the caller until it may send. Returns the delay applied.
    Seconds acquire(Priority priority = Priority::Normal);

    void report_rate_limit_hit(std::optional<Seconds> retry_after = std::nullopt);
    void report_success(Seconds response_time = Seconds(0));

    void add_observer(Observer observer);

    // Clears history, samples, backoff and metrics
    void reset();

    RateLimiterStats stats() const;
    Seconds current_backoff() const;
    int max_requests_per_window() const;
    RateRegime regime() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Sample {
        Clock::time_point at;
        double interval;
    };

    void prune_locked(Clock::time_point now);
    Seconds compute_delay_locked(Clock::time_point now, Priority priority);
    Seconds jitter_locked(Seconds base);
    void update_metrics_locked();
    bool should_adapt_locked(Clock::time_point now) const;
    bool adapt_locked(Clock::time_point now);
    Seconds priority_interval(Priority priority) const;
    std::vector<std::string> recommendations_locked() const;

    RateLimitConfig config_;
    RateLimitMetrics metrics_;

    std::deque<Clock::time_point> window_;
    std::deque<Clock::time_point> burst_;
    std::optional<Clock::time_point> last_request_;

    int consecutive_hits_ = 0;
    std::optional<Clock::time_point> last_hit_;
    Seconds current_backoff_;

    std::deque<Sample> samples_;
    Clock::time_point last_adaptation_;
    RateRegime regime_ = RateRegime::Normal;

    std::mt19937 rng_;
    std::vector<Observer> observers_;
    mutable std::mutex mutex_;
};

} // namespace tollgate
