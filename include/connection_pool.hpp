#ifndef CONNECTION_POOL_HPP
#define CONNECTION_POOL_HPP

#include "config.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tollgate {

class TLSConnection;
#ifdef HAVE_NGHTTP2
class Http2Session;
#endif

struct PoolKey {
    std::string host;
    int port;
    bool use_tls;

    bool operator<(const PoolKey& other) const {
        if (host != other.host) return host < other.host;
        if (port != other.port) return port < other.port;
        return use_tls < other.use_tls;
    }

    std::string to_string() const {
        return (use_tls ? "https://" : "http://") + host + ":" + std::to_string(port);
    }
};

// One TCP (optionally TLS) connection. Owned by the pool while idle and
// by exactly one caller while in use.
class PooledConnection {
public:
    PooledConnection(int socket_fd, PoolKey key);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    const PoolKey& key() const { return key_; }
    int socket_fd() const { return socket_fd_; }

    void attach_tls(std::unique_ptr<TLSConnection> tls);
    TLSConnection* tls() const { return tls_.get(); }

#ifdef HAVE_NGHTTP2
    void attach_http2(std::unique_ptr<Http2Session> session);
    Http2Session* http2() const { return http2_.get(); }
#endif

    bool is_http2() const;

    // SO_RCVTIMEO / SO_SNDTIMEO
    void set_timeouts(Seconds read_timeout, Seconds write_timeout);

    // Throws TransportError (WriteTimeout, SendFailed)
    void send_all(const char* data, size_t len);

    // 0 when the peer closed; throws TransportError (ReadTimeout, ConnectionClosed)
    size_t recv_some(char* buf, size_t len);

    // Non-blocking peek: false if the peer closed or the socket failed
    bool is_alive() const;

    bool is_open() const { return socket_fd_ >= 0; }
    void close();

    std::chrono::steady_clock::time_point last_used;
    bool reused = false;  // handed out from the idle set

private:
    int socket_fd_;
    PoolKey key_;
    std::unique_ptr<TLSConnection> tls_;
#ifdef HAVE_NGHTTP2
    std::unique_ptr<Http2Session> http2_;
#endif
};

struct PoolStats {
    uint64_t created = 0;
    uint64_t reused = 0;
    uint64_t idle = 0;
    uint64_t in_use = 0;
    uint64_t waits = 0;
    uint64_t timeouts = 0;
};

class ConnectionPool {
public:
    explicit ConnectionPool(const ClientLimits& limits);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Idle connection for the key, a new one, or a wait of up to
    // pool_timeout. Throws TransportError (PoolTimeout, ClientClosed, and
    // whatever dialing raises).
    std::shared_ptr<PooledConnection> acquire(const std::string& host, int port, bool use_tls);

    // Return a connection. Not reusable ones are closed.
    void release(std::shared_ptr<PooledConnection> conn, bool reusable);

    // Close idle connections past keepalive_expiry. Returns how many.
    size_t cleanup_idle();

    // Close idle connections; in-use ones close when released
    void close_all();

    bool is_closed() const;

    PoolStats stats() const;

private:
    std::shared_ptr<PooledConnection> create_connection(const PoolKey& key);
    std::shared_ptr<PooledConnection> take_idle_locked(const PoolKey& key);
    bool evict_idle_locked(const PoolKey& keep);
    size_t idle_count_locked() const;

    ClientLimits limits_;
    std::map<PoolKey, std::vector<std::shared_ptr<PooledConnection>>> idle_;
    size_t in_use_ = 0;
    size_t dialing_ = 0;
    bool closed_ = false;

    uint64_t created_ = 0;
    uint64_t reused_ = 0;
    uint64_t waits_ = 0;
    uint64_t timeouts_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable available_;
};

} // namespace tollgate

#endif // CONNECTION_POOL_HPP
