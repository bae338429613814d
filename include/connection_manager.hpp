#pragma once

#include "config.hpp"
#include "http_client.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace tollgate {

// Owns one lazily built pooled client. A client that was closed by anyone
// is rebuilt on the next get_client().
class ConnectionManager {
public:
    using ClientFactory = std::function<std::shared_ptr<HttpClient>(const ClientLimits&)>;

    explicit ConnectionManager(const ClientLimits& limits, ClientFactory factory = nullptr);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    std::shared_ptr<HttpClient> get_client();

    // Idempotent
    void close();

    uint64_t clients_created() const;
    bool has_client() const;
    PoolStats pool_stats() const;
    const ClientLimits& limits() const { return limits_; }

private:
    ClientLimits limits_;
    ClientFactory factory_;
    std::shared_ptr<HttpClient> client_;
    uint64_t clients_created_ = 0;
    mutable std::mutex mutex_;
};

} // namespace tollgate
