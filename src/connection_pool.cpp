#include "connection_pool.hpp"
#include "dialer.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "tls_connection.hpp"
#ifdef HAVE_NGHTTP2
#include "http2_session.hpp"
#endif
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace tollgate {

namespace {

timeval to_timeval(Seconds s) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(s).count();
    if (us <= 0) us = 1;
    timeval tv;
    tv.tv_sec = static_cast<time_t>(us / 1000000);
    tv.tv_usec = static_cast<suseconds_t>(us % 1000000);
    return tv;
}

} // namespace

PooledConnection::PooledConnection(int socket_fd, PoolKey key)
    : last_used(std::chrono::steady_clock::now()),
      socket_fd_(socket_fd),
      key_(std::move(key)) {
}

PooledConnection::~PooledConnection() {
    close();
}

void PooledConnection::attach_tls(std::unique_ptr<TLSConnection> tls) {
    tls_ = std::move(tls);
}

#ifdef HAVE_NGHTTP2
void PooledConnection::attach_http2(std::unique_ptr<Http2Session> session) {
    http2_ = std::move(session);
}
#endif

bool PooledConnection::is_http2() const {
#ifdef HAVE_NGHTTP2
    return http2_ != nullptr;
#else
    return false;
#endif
}

void PooledConnection::set_timeouts(Seconds read_timeout, Seconds write_timeout) {
    if (socket_fd_ < 0) return;

    timeval rcv = to_timeval(read_timeout);
    timeval snd = to_timeval(write_timeout);
    setsockopt(socket_fd_, SOL_SOCKET, SO_RCVTIMEO, &rcv, sizeof(rcv));
    setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &snd, sizeof(snd));
}

void PooledConnection::send_all(const char* data, size_t len) {
    if (socket_fd_ < 0) {
        throw TransportError(TransportErrorKind::ConnectionClosed, key_.to_string());
    }

    if (tls_) {
        tls_->send(data, len);
        return;
    }

    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(socket_fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw TransportError(TransportErrorKind::WriteTimeout, key_.to_string());
            }
            throw TransportError(TransportErrorKind::SendFailed,
                                 key_.to_string() + ": " + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

size_t PooledConnection::recv_some(char* buf, size_t len) {
    if (socket_fd_ < 0) {
        throw TransportError(TransportErrorKind::ConnectionClosed, key_.to_string());
    }

    if (tls_) {
        return tls_->recv(buf, len);
    }

    while (true) {
        ssize_t n = ::recv(socket_fd_, buf, len, 0);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw TransportError(TransportErrorKind::ReadTimeout, key_.to_string());
        }
        throw TransportError(TransportErrorKind::ConnectionClosed,
                             key_.to_string() + ": " + std::strerror(errno));
    }
}

bool PooledConnection::is_alive() const {
    if (socket_fd_ < 0) return false;

#ifdef HAVE_NGHTTP2
    if (http2_ && !http2_->is_alive()) return false;
#endif

    char buf[1];
    ssize_t ret = ::recv(socket_fd_, buf, 1, MSG_PEEK | MSG_DONTWAIT);
    if (ret == 0) return false;
    if (ret < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return false;
    return true;
}

void PooledConnection::close() {
#ifdef HAVE_NGHTTP2
    http2_.reset();
#endif
    if (tls_) {
        tls_->close();
        tls_.reset();
    }
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

ConnectionPool::ConnectionPool(const ClientLimits& limits)
    : limits_(limits) {
}

ConnectionPool::~ConnectionPool() {
    close_all();
}

std::shared_ptr<PooledConnection> ConnectionPool::create_connection(const PoolKey& key) {
    auto connect_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(limits_.connect_timeout);
    int fd = Dialer::connect(key.host, key.port, connect_timeout);

    auto conn = std::make_shared<PooledConnection>(fd, key);

    if (key.use_tls) {
        // The handshake runs under the connect timeout
        conn->set_timeouts(limits_.connect_timeout, limits_.connect_timeout);

        std::vector<std::string> alpn;
#ifdef HAVE_NGHTTP2
        if (limits_.prefer_http2) {
            alpn.push_back("h2");
        }
#endif
        alpn.push_back("http/1.1");

        auto tls = std::make_unique<TLSConnection>(fd, key.host, limits_.verify_tls);
        tls->handshake(alpn);
        std::string negotiated = tls->alpn_protocol();
        conn->attach_tls(std::move(tls));

        conn->set_timeouts(limits_.read_timeout, limits_.write_timeout);

#ifdef HAVE_NGHTTP2
        if (negotiated == "h2") {
            auto session = std::make_unique<Http2Session>(*conn);
            session->start();
            conn->attach_http2(std::move(session));
        }
#endif
        logging::debug("connected to ", key.to_string(),
                       negotiated.empty() ? "" : " (" + negotiated + ")");
    } else {
        conn->set_timeouts(limits_.read_timeout, limits_.write_timeout);
        logging::debug("connected to ", key.to_string());
    }

    conn->last_used = std::chrono::steady_clock::now();
    return conn;
}

std::shared_ptr<PooledConnection> ConnectionPool::take_idle_locked(const PoolKey& key) {
    auto it = idle_.find(key);
    if (it == idle_.end()) {
        return nullptr;
    }

    auto now = std::chrono::steady_clock::now();
    auto& pool = it->second;

    // Most recently used first
    while (!pool.empty()) {
        auto conn = pool.back();
        pool.pop_back();

        if (now - conn->last_used >= limits_.keepalive_expiry || !conn->is_alive()) {
            conn->close();
            continue;
        }

        conn->last_used = now;
        return conn;
    }
    return nullptr;
}

bool ConnectionPool::evict_idle_locked(const PoolKey& keep) {
    std::shared_ptr<PooledConnection> oldest;
    std::vector<std::shared_ptr<PooledConnection>>* owner = nullptr;

    for (auto& entry : idle_) {
        if (!(entry.first < keep) && !(keep < entry.first)) continue;
        for (auto& conn : entry.second) {
            if (!oldest || conn->last_used < oldest->last_used) {
                oldest = conn;
                owner = &entry.second;
            }
        }
    }

    if (!oldest) {
        return false;
    }

    owner->erase(std::find(owner->begin(), owner->end(), oldest));
    oldest->close();
    return true;
}

size_t ConnectionPool::idle_count_locked() const {
    size_t count = 0;
    for (const auto& entry : idle_) {
        count += entry.second.size();
    }
    return count;
}

std::shared_ptr<PooledConnection> ConnectionPool::acquire(const std::string& host,
                                                          int port,
                                                          bool use_tls) {
    PoolKey key{host, port, use_tls};
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(limits_.pool_timeout);
    bool counted_wait = false;

    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (closed_) {
            throw TransportError(TransportErrorKind::ClientClosed, "connection pool is closed");
        }

        if (auto conn = take_idle_locked(key)) {
            ++in_use_;
            ++reused_;
            conn->reused = true;
            return conn;
        }

        size_t total = idle_count_locked() + in_use_ + dialing_;
        if (total < static_cast<size_t>(limits_.max_connections)) {
            break;
        }

        // Make room by closing an idle connection of another origin
        if (evict_idle_locked(key)) {
            break;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            ++timeouts_;
            throw TransportError(TransportErrorKind::PoolTimeout,
                                 "no connection to " + key.to_string() + " within " +
                                 std::to_string(limits_.pool_timeout.count()) + "s");
        }

        if (!counted_wait) {
            ++waits_;
            counted_wait = true;
        }
        available_.wait_until(lock, deadline);
    }

    ++dialing_;
    lock.unlock();

    std::shared_ptr<PooledConnection> conn;
    try {
        conn = create_connection(key);
    } catch (const std::exception&) {
        lock.lock();
        --dialing_;
        available_.notify_one();
        throw;
    }

    lock.lock();
    --dialing_;
    ++in_use_;
    ++created_;
    return conn;
}

void ConnectionPool::release(std::shared_ptr<PooledConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (in_use_ > 0) {
        --in_use_;
    }

    if (!reusable || closed_ || !conn->is_open() ||
        idle_count_locked() >= static_cast<size_t>(limits_.max_keepalive_connections)) {
        conn->close();
    } else {
        conn->last_used = std::chrono::steady_clock::now();
        idle_[conn->key()].push_back(std::move(conn));
    }

    available_.notify_one();
}

size_t ConnectionPool::cleanup_idle() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    size_t closed = 0;

    for (auto& entry : idle_) {
        auto& pool = entry.second;
        pool.erase(
            std::remove_if(pool.begin(), pool.end(),
                [&](const std::shared_ptr<PooledConnection>& conn) {
                    if (now - conn->last_used >= limits_.keepalive_expiry) {
                        conn->close();
                        ++closed;
                        return true;
                    }
                    return false;
                }),
            pool.end());
    }

    if (closed > 0) {
        available_.notify_all();
    }
    return closed;
}

void ConnectionPool::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& entry : idle_) {
        for (auto& conn : entry.second) {
            conn->close();
        }
    }
    idle_.clear();
    closed_ = true;
    available_.notify_all();
}

bool ConnectionPool::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

PoolStats ConnectionPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStats s;
    s.created = created_;
    s.reused = reused_;
    s.idle = idle_count_locked();
    s.in_use = in_use_;
    s.waits = waits_;
    s.timeouts = timeouts_;
    return s;
}

} // namespace tollgate
