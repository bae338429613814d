#include "request_deduplicator.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "logging.hpp"

#include <mbedtls/md.h>

#include <algorithm>
#include <cctype>
#include <exception>

namespace tollgate {

namespace {

const char* const kIgnoredHeaders[] = {
    "authorization",
    "user-agent",
    "x-request-id",
    "request-id",
};

bool is_ignored_header(const std::string& lower_name) {
    for (const char* name : kIgnoredHeaders) {
        if (lower_name == name) return true;
    }
    return false;
}

std::string normalize_url(const std::string& url) {
    auto parsed = URL::parse(url);
    return parsed ? parsed->to_string() : url;
}

std::string sha256_hex(const std::string& input) {
    const mbedtls_md_info_t* info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    unsigned char digest[32];

    int ret = mbedtls_md(info, reinterpret_cast<const unsigned char*>(input.data()),
                         input.size(), digest);
    if (ret != 0) {
        throw Error("sha256 failed (" + std::to_string(ret) + ")");
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(64);
    for (unsigned char byte : digest) {
        out += hex[byte >> 4];
        out += hex[byte & 0x0f];
    }
    return out;
}

} // namespace

std::string make_dedup_key(const std::string& method,
                           const std::string& url,
                           const std::map<std::string, std::string>& headers,
                           const nlohmann::json& body) {
    std::string upper_method = method;
    std::transform(upper_method.begin(), upper_method.end(), upper_method.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::string key = upper_method + "|" + normalize_url(url);

    // json objects keep their keys sorted, so the dump is canonical
    nlohmann::json relevant = nlohmann::json::object();
    for (const auto& [name, value] : headers) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!is_ignored_header(lower)) {
            relevant[lower] = value;
        }
    }
    if (!relevant.empty()) {
        key += "|" + relevant.dump();
    }

    if (!body.is_null()) {
        key += "|" + body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    return sha256_hex(key);
}

nlohmann::json RequestDeduplicator::join(const std::string& key,
                                         const Producer& produce,
                                         std::optional<Seconds> max_wait) {
    std::promise<nlohmann::json> promise;
    std::shared_future<nlohmann::json> shared;
    bool leader = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(key);
        if (it != in_flight_.end()) {
            shared = it->second;
            ++deduplicated_;
        } else {
            shared = promise.get_future().share();
            in_flight_.emplace(key, shared);
            ++leaders_;
            leader = true;
        }
    }

    if (leader) {
        try {
            nlohmann::json result = produce();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                in_flight_.erase(key);
            }
            promise.set_value(result);
            return result;
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                in_flight_.erase(key);
            }
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    logging::debug("dedup: joined in-flight request ", key.substr(0, 12));

    if (max_wait && shared.wait_for(*max_wait) == std::future_status::timeout) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++wait_timeouts_;
        }
        throw DedupWaitTimeout("gave up waiting for in-flight request after " +
                               std::to_string(max_wait->count()) + "s");
    }
    return shared.get();
}

DedupStats RequestDeduplicator::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DedupStats s;
    s.leaders = leaders_;
    s.deduplicated = deduplicated_;
    s.wait_timeouts = wait_timeouts_;
    s.in_flight = in_flight_.size();
    return s;
}

size_t RequestDeduplicator::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

void RequestDeduplicator::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    leaders_ = 0;
    deduplicated_ = 0;
    wait_timeouts_ = 0;
}

} // namespace tollgate
