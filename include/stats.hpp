#pragma once

#include "config.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace tollgate {

struct RequestMetrics {
    uint64_t total_requests = 0;       // network + cached
    uint64_t network_requests = 0;
    uint64_t cached_responses = 0;
    uint64_t batched_requests = 0;
    uint64_t deduplicated_requests = 0;
    uint64_t slow_requests = 0;
    uint64_t total_errors = 0;
    uint64_t bytes_received = 0;

    double total_response_time_seconds = 0.0;
    double avg_response_time_seconds = 0.0;
    double fastest_request_seconds = 0.0;
    double slowest_request_seconds = 0.0;
    double p50_seconds = 0.0;
    double p90_seconds = 0.0;
    double p99_seconds = 0.0;
    double cache_hit_ratio = 0.0;

    std::map<std::string, uint64_t> error_counts;
};

void to_json(nlohmann::json& j, const RequestMetrics& metrics);

// Request metrics owned by the optimizer. Only changed through record_*.
class Statistics {
public:
    // Bounded buffer of response times the percentiles are computed from
    static constexpr size_t MAX_TIMING_SAMPLES = 1000;

    Statistics() = default;

    void record_response(Seconds elapsed, size_t bytes_received);
    void record_cache_hit();
    void record_deduplicated();
    void record_batched(size_t items);
    void record_slow_request();
    void record_error(const std::string& error_type);

    RequestMetrics snapshot() const;
    void reset();

private:
    RequestMetrics metrics_;
    double fastest_ = -1.0;
    std::deque<double> samples_;
    mutable std::mutex mutex_;
};

// Box-drawn report in the terminal style of the rest of the tool
class ReportPrinter {
public:
    ReportPrinter(std::ostream& out, bool colored);

    void title(const std::string& text);
    void begin_section(const std::string& name);
    void line(const std::string& label, const std::string& value, bool last = false);
    void table(const std::vector<std::string>& headers, const std::vector<std::string>& values);
    void end_section();

    static std::string fixed(double value, int precision, const std::string& suffix = "");

private:
    void box_line(const std::string& uncolored, const std::string& colored);
    std::string paint(const char* color, const std::string& text) const;

    std::ostream& out_;
    bool colored_;
};

} // namespace tollgate
