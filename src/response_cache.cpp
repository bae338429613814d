#include "response_cache.hpp"
#include "logging.hpp"

#include <cmath>

namespace tollgate {

namespace {

double round_to(double value, int digits) {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

} // namespace

void to_json(nlohmann::json& j, const CacheStats& stats) {
    j = nlohmann::json{
        {"entries_count", stats.entries},
        {"size_bytes", stats.size_bytes},
        {"size_mb", stats.size_mb},
        {"utilization_percentage", stats.utilization_percent},
        {"total_hits", stats.total_hits},
        {"avg_hits_per_entry", stats.avg_hits_per_entry},
        {"evictions", stats.evictions},
        {"expirations", stats.expirations},
    };
}

ResponseCache::ResponseCache(const CacheConfig& config)
    : config_(config) {
}

size_t ResponseCache::estimate_size(const nlohmann::json& value) {
    try {
        return value.dump().size();
    } catch (const nlohmann::json::exception&) {
        // e.g. invalid UTF-8 inside a string
        return FALLBACK_SIZE_ESTIMATE;
    }
}

std::optional<nlohmann::json> ResponseCache::get(const std::string& key) {
    if (!config_.enabled) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    auto now = Clock::now();
    if (now > it->second.entry.expires_at) {
        remove_locked(it);
        ++expirations_;
        return std::nullopt;
    }

    auto& slot = it->second;
    slot.entry.hit_count++;
    slot.entry.last_accessed = now;
    order_.splice(order_.end(), order_, slot.position);

    return slot.entry.data;
}

bool ResponseCache::put(const std::string& key, const nlohmann::json& value,
                        std::optional<Seconds> ttl) {
    if (!config_.enabled) {
        return false;
    }

    Seconds effective = (ttl && ttl->count() > 0) ? *ttl : config_.default_ttl;
    if (effective > config_.max_age) {
        effective = config_.max_age;
    }

    size_t size = estimate_size(value);
    auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        remove_locked(existing);
    }

    while (current_bytes_ + size > config_.max_size_bytes && !entries_.empty()) {
        evict_lru_locked();
    }

    CacheEntry entry;
    entry.data = value;
    entry.created_at = now;
    entry.expires_at = now + std::chrono::duration_cast<Clock::duration>(effective);
    entry.last_accessed = now;
    entry.size_bytes = size;

    auto position = order_.insert(order_.end(), key);
    entries_.emplace(key, Slot{std::move(entry), position});
    current_bytes_ += size;

    return true;
}

size_t ResponseCache::invalidate(const std::optional<std::string>& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!pattern) {
        size_t removed = entries_.size();
        entries_.clear();
        order_.clear();
        current_bytes_ = 0;
        logging::debug("cache: cleared ", removed, " entries");
        return removed;
    }

    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.find(*pattern) != std::string::npos) {
            auto next = std::next(it);
            remove_locked(it);
            it = next;
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        logging::debug("cache: invalidated ", removed, " entries matching '", *pattern, "'");
    }
    return removed;
}

size_t ResponseCache::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = Clock::now();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now > it->second.entry.expires_at) {
            auto next = std::next(it);
            remove_locked(it);
            it = next;
            ++removed;
        } else {
            ++it;
        }
    }
    expirations_ += removed;
    return removed;
}

CacheStats ResponseCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheStats s;
    s.entries = entries_.size();
    s.size_bytes = current_bytes_;
    s.size_mb = round_to(static_cast<double>(current_bytes_) / (1024.0 * 1024.0), 2);
    s.utilization_percent = config_.max_size_bytes > 0
        ? round_to(static_cast<double>(current_bytes_) * 100.0 /
                   static_cast<double>(config_.max_size_bytes), 1)
        : 0.0;

    for (const auto& item : entries_) {
        s.total_hits += item.second.entry.hit_count;
    }
    s.avg_hits_per_entry = s.entries > 0
        ? round_to(static_cast<double>(s.total_hits) / static_cast<double>(s.entries), 1)
        : 0.0;

    s.evictions = evictions_;
    s.expirations = expirations_;
    return s;
}

size_t ResponseCache::size_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_bytes_;
}

size_t ResponseCache::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ResponseCache::remove_locked(std::unordered_map<std::string, Slot>::iterator it) {
    current_bytes_ -= it->second.entry.size_bytes;
    order_.erase(it->second.position);
    entries_.erase(it);
}

void ResponseCache::evict_lru_locked() {
    if (order_.empty()) {
        return;
    }
    auto it = entries_.find(order_.front());
    if (it != entries_.end()) {
        remove_locked(it);
        ++evictions_;
    }
}

} // namespace tollgate
