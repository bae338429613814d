#pragma once

#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace tollgate {

struct CacheEntry {
    nlohmann::json data;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point expires_at;
    std::chrono::steady_clock::time_point last_accessed;
    uint64_t hit_count = 0;
    size_t size_bytes = 0;
};

struct CacheStats {
    size_t entries = 0;
    size_t size_bytes = 0;
    double size_mb = 0.0;
    double utilization_percent = 0.0;
    uint64_t total_hits = 0;
    double avg_hits_per_entry = 0.0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
};

void to_json(nlohmann::json& j, const CacheStats& stats);

// Byte-bounded LRU cache of JSON payloads with per-entry TTL.
class ResponseCache {
public:
    static constexpr size_t FALLBACK_SIZE_ESTIMATE = 1024;

    explicit ResponseCache(const CacheConfig& config);

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // Absent if disabled, missing or expired. A hit refreshes recency.
    std::optional<nlohmann::json> get(const std::string& key);

    // False only when the cache is disabled. Non-positive ttl means the default.
    bool put(const std::string& key, const nlohmann::json& value,
             std::optional<Seconds> ttl = std::nullopt);

    // Everything when no pattern, else every key containing it. Returns the count.
    size_t invalidate(const std::optional<std::string>& pattern = std::nullopt);

    size_t purge_expired();

    CacheStats stats() const;

    bool enabled() const { return config_.enabled; }
    size_t size_bytes() const;
    size_t entry_count() const;

    // Compact serialization length, or the fallback when serialization fails
    static size_t estimate_size(const nlohmann::json& value);

private:
    using Clock = std::chrono::steady_clock;
    using LruList = std::list<std::string>;

    struct Slot {
        CacheEntry entry;
        LruList::iterator position;
    };

    void remove_locked(std::unordered_map<std::string, Slot>::iterator it);
    void evict_lru_locked();

    CacheConfig config_;
    LruList order_;  // front is least recently used
    std::unordered_map<std::string, Slot> entries_;
    size_t current_bytes_ = 0;
    uint64_t evictions_ = 0;
    uint64_t expirations_ = 0;
    mutable std::mutex mutex_;
};

} // namespace tollgate
