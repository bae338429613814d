#include "rate_limiter.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace tollgate {

namespace {

constexpr double kGoldenRatio = 1.618;

double round_to(double value, int digits) {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

std::string fmt_seconds(Seconds s) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << s.count() << "s";
    return out.str();
}

} // namespace

const char* to_string(RateRegime regime) {
    switch (regime) {
        case RateRegime::Normal:        return "normal";
        case RateRegime::BurstLimited:  return "burst_limited";
        case RateRegime::WindowLimited: return "window_limited";
        case RateRegime::BackingOff:    return "backing_off";
        case RateRegime::Adapting:      return "adapting";
    }
    return "normal";
}

Seconds BackoffPolicy::next(const RateLimitConfig& config,
                            Seconds current,
                            std::optional<Seconds> server_hint) {
    if (server_hint && server_hint->count() > 0) {
        return std::clamp(*server_hint, config.min_backoff, config.max_backoff);
    }

    Seconds next = current;
    switch (config.backoff_strategy) {
        case BackoffStrategy::Linear:
            next = current + config.min_backoff;
            break;
        case BackoffStrategy::Exponential:
            next = current * config.backoff_multiplier;
            break;
        case BackoffStrategy::Fibonacci:
            next = current * kGoldenRatio;
            break;
    }
    return std::clamp(next, config.min_backoff, config.max_backoff);
}

void to_json(nlohmann::json& j, const RateLimiterStats& stats) {
    j = nlohmann::json{
        {"config", {
            {"max_requests_per_window", stats.max_requests_per_window},
            {"window_seconds", stats.window_seconds},
            {"burst_limit", stats.burst_limit},
            {"backoff_strategy", stats.backoff_strategy},
        }},
        {"current_state", {
            {"requests_in_window", stats.requests_in_window},
            {"requests_in_burst_window", stats.requests_in_burst_window},
            {"consecutive_rate_limits", stats.consecutive_rate_limits},
            {"current_backoff_seconds", stats.current_backoff_seconds},
            {"current_rate_per_second", stats.current_rate_per_second},
            {"regime", to_string(stats.regime)},
        }},
        {"performance", {
            {"total_requests", stats.total_requests},
            {"requests_delayed", stats.requests_delayed},
            {"efficiency_percentage", stats.efficiency_percent},
            {"avg_delay_seconds", stats.avg_delay_seconds},
            {"rate_limit_hits", stats.rate_limit_hits},
            {"backoff_events", stats.backoff_events},
            {"avg_response_time_seconds", stats.avg_response_time_seconds},
        }},
        {"recommendations", stats.recommendations},
    };
}

AdaptiveRateLimiter::AdaptiveRateLimiter(const RateLimitConfig& config)
    : config_(config),
      current_backoff_(config.min_backoff),
      last_adaptation_(Clock::now()),
      rng_(std::random_device{}()) {
}

Seconds AdaptiveRateLimiter::priority_interval(Priority priority) const {
    switch (priority) {
        case Priority::High:   return config_.high_priority_interval;
        case Priority::Normal: return config_.normal_priority_interval;
        case Priority::Low:    return config_.low_priority_interval;
    }
    return config_.normal_priority_interval;
}

void AdaptiveRateLimiter::prune_locked(Clock::time_point now) {
    auto window_cutoff = now - std::chrono::duration_cast<Clock::duration>(config_.window);
    while (!window_.empty() && window_.front() <= window_cutoff) {
        window_.pop_front();
    }

    auto burst_cutoff = now - std::chrono::duration_cast<Clock::duration>(config_.burst_window);
    while (!burst_.empty() && burst_.front() <= burst_cutoff) {
        burst_.pop_front();
    }
}

Seconds AdaptiveRateLimiter::jitter_locked(Seconds base) {
    if (!config_.jitter_enabled || base.count() <= 0) {
        return Seconds(0);
    }
    std::uniform_real_distribution<double> dist(0.0, base.count());
    return Seconds(dist(rng_));
}

Seconds AdaptiveRateLimiter::compute_delay_locked(Clock::time_point now, Priority priority) {
    // Burst cap
    if (burst_.size() >= static_cast<size_t>(config_.burst_limit)) {
        Seconds burst_delay = config_.burst_window - Seconds(now - burst_.front());
        if (burst_delay.count() > 0) {
            regime_ = RateRegime::BurstLimited;
            return burst_delay + jitter_locked(burst_delay * 0.1);
        }
    }

    // Window capacity
    if (window_.size() >= static_cast<size_t>(config_.max_requests_per_window)) {
        Seconds window_delay = config_.window - Seconds(now - window_.front());
        if (window_delay.count() > 0) {
            Seconds base = window_delay;
            if (consecutive_hits_ > 0) {
                base = std::max(base, current_backoff_);
            }
            regime_ = RateRegime::WindowLimited;
            return base + jitter_locked(base * 0.1);
        }
    }

    // Active backoff period
    if (consecutive_hits_ > 0 && last_hit_) {
        Seconds since_hit = now - *last_hit_;
        if (since_hit < current_backoff_) {
            regime_ = RateRegime::BackingOff;
            return current_backoff_ - since_hit;
        }
    }

    regime_ = consecutive_hits_ > 0 ? RateRegime::BackingOff : RateRegime::Normal;

    // Priority spacing
    if (last_request_) {
        Seconds since_last = now - *last_request_;
        Seconds min_interval = priority_interval(priority);
        if (since_last < min_interval) {
            return min_interval - since_last;
        }
    }

    return Seconds(0);
}

void AdaptiveRateLimiter::update_metrics_locked() {
    if (window_.size() >= 2) {
        double span = Seconds(window_.back() - window_.front()).count();
        if (span > 0) {
            metrics_.current_rate_per_second = static_cast<double>(window_.size()) / span;
            metrics_.avg_request_interval = span / static_cast<double>(window_.size() - 1);
        }
    }
}

bool AdaptiveRateLimiter::should_adapt_locked(Clock::time_point now) const {
    return config_.adaptive_enabled && Seconds(now - last_adaptation_) >= config_.adaptive_interval;
}

bool AdaptiveRateLimiter::adapt_locked(Clock::time_point now) {
    last_adaptation_ = now;

    if (samples_.size() < config_.adaptive_min_samples) {
        return false;
    }

    double total = 0.0;
    for (const auto& sample : samples_) {
        total += sample.interval;
    }
    double avg_interval = total / static_cast<double>(samples_.size());
    if (avg_interval <= 0) {
        return false;
    }

    double achievable = 1.0 / avg_interval;
    double configured = config_.max_requests_per_window / config_.window.count();
    int before = config_.max_requests_per_window;

    if (achievable > configured * 1.2 && consecutive_hits_ == 0) {
        config_.max_requests_per_window = std::min(before + config_.adaptive_step,
                                                   config_.adaptive_ceiling);
    } else if (consecutive_hits_ > config_.adaptive_decrease_threshold) {
        config_.max_requests_per_window = std::max(before - config_.adaptive_step,
                                                   config_.adaptive_floor);
    }

    if (config_.max_requests_per_window != before) {
        logging::info("rate limit adapted: ", before, " -> ", config_.max_requests_per_window,
                      " requests per ", config_.window.count(), "s");
        return true;
    }
    return false;
}

Seconds AdaptiveRateLimiter::acquire(Priority priority) {
    Seconds delay(0);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        prune_locked(now);
        delay = compute_delay_locked(now, priority);

        if (delay.count() > 0) {
            metrics_.requests_delayed++;
            metrics_.total_delay_seconds += delay.count();
        }
    }

    if (delay.count() > 0) {
        logging::debug("rate limit: delaying ", fmt_seconds(delay),
                       " (", to_string(priority), " priority)");
        std::this_thread::sleep_for(delay);
    }

    RateLimitMetrics snapshot;
    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        window_.push_back(now);
        burst_.push_back(now);
        last_request_ = now;
        metrics_.total_requests++;

        update_metrics_locked();

        if (should_adapt_locked(now) && adapt_locked(now)) {
            regime_ = RateRegime::Adapting;
        }

        snapshot = metrics_;
        observers = observers_;
    }

    for (const auto& observer : observers) {
        try {
            observer(snapshot);
        } catch (const std::exception& e) {
            logging::warn("rate limit observer failed: ", e.what());
        }
    }

    return delay;
}

void AdaptiveRateLimiter::report_rate_limit_hit(std::optional<Seconds> retry_after) {
    std::lock_guard<std::mutex> lock(mutex_);

    metrics_.rate_limit_hits++;
    consecutive_hits_++;
    last_hit_ = Clock::now();

    current_backoff_ = BackoffPolicy::next(config_, current_backoff_, retry_after);
    metrics_.backoff_events++;
    regime_ = RateRegime::BackingOff;

    logging::warn("rate limit hit (#", consecutive_hits_, "), backing off to ",
                  fmt_seconds(current_backoff_));
}

void AdaptiveRateLimiter::report_success(Seconds response_time) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (consecutive_hits_ > 0) {
        logging::info("rate limit cleared after ", consecutive_hits_, " hits");
        consecutive_hits_ = 0;
        current_backoff_ = config_.min_backoff;
        regime_ = RateRegime::Normal;
    }

    metrics_.successes++;
    metrics_.total_response_time_seconds += response_time.count();

    auto now = Clock::now();
    if (last_request_) {
        samples_.push_back(Sample{now, Seconds(now - *last_request_).count()});
    }

    auto horizon = now - std::chrono::duration_cast<Clock::duration>(SAMPLE_HORIZON);
    while (!samples_.empty() &&
           (samples_.size() > MAX_SUCCESS_SAMPLES || samples_.front().at < horizon)) {
        samples_.pop_front();
    }
}

void AdaptiveRateLimiter::add_observer(Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

void AdaptiveRateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);

    metrics_ = RateLimitMetrics();
    window_.clear();
    burst_.clear();
    last_request_.reset();
    samples_.clear();
    consecutive_hits_ = 0;
    last_hit_.reset();
    current_backoff_ = config_.min_backoff;
    regime_ = RateRegime::Normal;
    last_adaptation_ = Clock::now();
}

std::vector<std::string> AdaptiveRateLimiter::recommendations_locked() const {
    std::vector<std::string> out;

    double efficiency = 1.0;
    if (metrics_.total_requests > 0) {
        efficiency = 1.0 - static_cast<double>(metrics_.requests_delayed) /
                           static_cast<double>(metrics_.total_requests);
    }

    if (efficiency < 0.8) {
        out.push_back("Low efficiency detected - consider reducing request rate");
    }
    if (consecutive_hits_ > 5) {
        out.push_back("Frequent rate limits - API limits may have changed");
    }
    if (metrics_.current_rate_per_second > 8) {
        out.push_back("High request rate - monitor for rate limit hits");
    }
    if (window_.size() >= static_cast<size_t>(config_.max_requests_per_window)) {
        out.push_back("Operating at rate limit capacity - consider request batching");
    }
    return out;
}

RateLimiterStats AdaptiveRateLimiter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    RateLimiterStats s;
    s.max_requests_per_window = config_.max_requests_per_window;
    s.window_seconds = config_.window.count();
    s.burst_limit = config_.burst_limit;
    s.backoff_strategy = to_string(config_.backoff_strategy);

    s.requests_in_window = window_.size();
    s.requests_in_burst_window = burst_.size();
    s.consecutive_rate_limits = consecutive_hits_;
    s.current_backoff_seconds = current_backoff_.count();
    s.current_rate_per_second = round_to(metrics_.current_rate_per_second, 2);
    s.regime = regime_;

    s.total_requests = metrics_.total_requests;
    s.requests_delayed = metrics_.requests_delayed;
    if (metrics_.total_requests > 0) {
        s.efficiency_percent = round_to(
            (1.0 - static_cast<double>(metrics_.requests_delayed) /
                   static_cast<double>(metrics_.total_requests)) * 100.0, 1);
    }
    if (metrics_.requests_delayed > 0) {
        s.avg_delay_seconds = round_to(
            metrics_.total_delay_seconds / static_cast<double>(metrics_.requests_delayed), 3);
    }
    s.rate_limit_hits = metrics_.rate_limit_hits;
    s.backoff_events = metrics_.backoff_events;
    if (metrics_.successes > 0) {
        s.avg_response_time_seconds = round_to(
            metrics_.total_response_time_seconds / static_cast<double>(metrics_.successes), 3);
    }

    s.recommendations = recommendations_locked();
    return s;
}

Seconds AdaptiveRateLimiter::current_backoff() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_backoff_;
}

int AdaptiveRateLimiter::max_requests_per_window() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.max_requests_per_window;
}

RateRegime AdaptiveRateLimiter::regime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return regime_;
}

} // namespace tollgate
