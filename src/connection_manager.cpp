#include "connection_manager.hpp"
#include "logging.hpp"

namespace tollgate {

ConnectionManager::ConnectionManager(const ClientLimits& limits, ClientFactory factory)
    : limits_(limits), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [](const ClientLimits& l) { return std::make_shared<HttpClient>(l); };
    }
}

ConnectionManager::~ConnectionManager() {
    close();
}

std::shared_ptr<HttpClient> ConnectionManager::get_client() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (client_ && !client_->is_closed()) {
        return client_;
    }

    client_ = factory_(limits_);
    ++clients_created_;

    logging::info("http client created (max_connections=", limits_.max_connections,
                  ", keepalive=", limits_.max_keepalive_connections,
                  ", http2=", limits_.prefer_http2 ? "preferred" : "off", ")");
    return client_;
}

void ConnectionManager::close() {
    std::shared_ptr<HttpClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = std::move(client_);
        client_.reset();
    }

    if (client && !client->is_closed()) {
        client->close();
        logging::info("http client closed");
    }
}

uint64_t ConnectionManager::clients_created() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_created_;
}

bool ConnectionManager::has_client() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_ && !client_->is_closed();
}

PoolStats ConnectionManager::pool_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_ ? client_->pool_stats() : PoolStats();
}

} // namespace tollgate
