#include "dialer.hpp"
#include "errors.hpp"
#include <sys/types.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace tollgate {

std::vector<ResolvedAddress> Dialer::resolve(const std::string& host, int port) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    hints.ai_flags = AI_ADDRCONFIG;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);

    int ret = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (ret != 0) {
        throw TransportError(TransportErrorKind::ResolveFailed,
                             host + ": " + gai_strerror(ret));
    }

    std::vector<ResolvedAddress> addrs;
    for (struct addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
        if (rp->ai_family != AF_INET && rp->ai_family != AF_INET6) continue;

        ResolvedAddress addr{};
        addr.family = rp->ai_family;
        addr.socktype = rp->ai_socktype;
        addr.protocol = rp->ai_protocol;
        addr.addrlen = rp->ai_addrlen;
        std::memcpy(&addr.addr, rp->ai_addr, rp->ai_addrlen);
        addrs.push_back(addr);
    }
    freeaddrinfo(result);

    if (addrs.empty()) {
        throw TransportError(TransportErrorKind::ResolveFailed, host + ": no usable addresses");
    }
    return interleave(std::move(addrs));
}

// IPv6 first, then alternate families
std::vector<ResolvedAddress> Dialer::interleave(std::vector<ResolvedAddress> addrs) {
    std::vector<ResolvedAddress> v6, v4;
    for (auto& a : addrs) {
        (a.family == AF_INET6 ? v6 : v4).push_back(a);
    }

    std::vector<ResolvedAddress> ordered;
    ordered.reserve(addrs.size());
    size_t i = 0, j = 0;
    while (i < v6.size() || j < v4.size()) {
        if (i < v6.size()) ordered.push_back(v6[i++]);
        if (j < v4.size()) ordered.push_back(v4[j++]);
    }
    return ordered;
}

int Dialer::start_attempt(const ResolvedAddress& addr) {
    int fd = ::socket(addr.family, addr.socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, addr.protocol);
    if (fd < 0) {
        return -1;
    }

    int ret = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr.addr), addr.addrlen);
    if (ret != 0 && errno != EINPROGRESS) {
        ::close(fd);
        return -1;
    }
    return fd;
}

void Dialer::finish_socket(int fd) {
    int flag = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
}

int Dialer::connect(const std::string& host, int port, std::chrono::milliseconds timeout) {
    auto addrs = resolve(host, port);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<struct pollfd> pending;
    size_t next = 0;
    int last_error = 0;

    auto close_pending = [&pending](int keep) {
        for (auto& p : pending) {
            if (p.fd != keep) ::close(p.fd);
        }
        pending.clear();
    };

    while (true) {
        // Start the next attempt when nothing is in flight or the stagger delay passed
        if (next < addrs.size()) {
            int fd = start_attempt(addrs[next++]);
            if (fd >= 0) {
                pending.push_back({fd, POLLOUT, 0});
            } else {
                last_error = errno;
            }
        }

        if (pending.empty()) {
            if (next < addrs.size()) continue;
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            close_pending(-1);
            throw TransportError(TransportErrorKind::ConnectTimeout,
                                 host + ":" + std::to_string(port));
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto wait = next < addrs.size() ? std::min(remaining, std::chrono::milliseconds(CONNECTION_ATTEMPT_DELAY))
                                        : remaining;

        int ready = ::poll(pending.data(), pending.size(), static_cast<int>(wait.count()));
        if (ready < 0 && errno != EINTR) {
            last_error = errno;
            close_pending(-1);
            break;
        }

        for (size_t k = 0; k < pending.size();) {
            if (pending[k].revents == 0) {
                ++k;
                continue;
            }

            int fd = pending[k].fd;
            int error = 0;
            socklen_t len = sizeof(error);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &len);

            if (error == 0 && (pending[k].revents & POLLOUT)) {
                close_pending(fd);
                finish_socket(fd);
                return fd;
            }

            last_error = error;
            ::close(fd);
            pending.erase(pending.begin() + k);
        }
    }

    throw TransportError(TransportErrorKind::ConnectFailed,
                         host + ":" + std::to_string(port) +
                         (last_error ? std::string(" (") + std::strerror(last_error) + ")" : std::string()));
}

} // namespace tollgate
