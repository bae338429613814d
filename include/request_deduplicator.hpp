#pragma once

#include "config.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace tollgate {

// SHA-256 hex digest over method, normalized URL, the relevant headers and
// the canonical body. Credentials and per-request ids do not take part.
std::string make_dedup_key(const std::string& method,
                           const std::string& url,
                           const std::map<std::string, std::string>& headers,
                           const nlohmann::json& body);

struct DedupStats {
    uint64_t leaders = 0;
    uint64_t deduplicated = 0;
    uint64_t wait_timeouts = 0;
    size_t in_flight = 0;
};

// Collapses concurrent identical requests into one call. Every caller of a
// cluster sees the same value or the same exception.
class RequestDeduplicator {
public:
    using Producer = std::function<nlohmann::json()>;

    RequestDeduplicator() = default;

    RequestDeduplicator(const RequestDeduplicator&) = delete;
    RequestDeduplicator& operator=(const RequestDeduplicator&) = delete;

    // The first caller for |key| runs |produce|; later callers wait for its
    // outcome. A waiter whose |max_wait| expires gets DedupWaitTimeout, the
    // shared call carries on for the others.
    nlohmann::json join(const std::string& key,
                        const Producer& produce,
                        std::optional<Seconds> max_wait = std::nullopt);

    DedupStats stats() const;
    size_t in_flight() const;
    void reset_stats();

private:
    std::unordered_map<std::string, std::shared_future<nlohmann::json>> in_flight_;
    uint64_t leaders_ = 0;
    uint64_t deduplicated_ = 0;
    uint64_t wait_timeouts_ = 0;
    mutable std::mutex mutex_;
};

} // namespace tollgate
