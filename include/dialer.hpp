#ifndef DIALER_HPP
#define DIALER_HPP

#include <chrono>
#include <string>
#include <vector>
#include <sys/socket.h>
#include <netinet/in.h>

namespace tollgate {

struct ResolvedAddress {
    int family;
    int socktype;
    int protocol;
    sockaddr_storage addr;
    socklen_t addrlen;
};

// Happy Eyeballs (RFC 8305) style dialing: addresses are interleaved by
// family and attempts are staggered, the first to complete wins.
class Dialer {
public:
    static constexpr auto CONNECTION_ATTEMPT_DELAY = std::chrono::milliseconds(250);

    // Returns a connected, blocking socket with TCP_NODELAY set.
    // Throws TransportError (ResolveFailed, ConnectFailed, ConnectTimeout).
    static int connect(const std::string& host, int port, std::chrono::milliseconds timeout);

    static std::vector<ResolvedAddress> resolve(const std::string& host, int port);

private:
    static std::vector<ResolvedAddress> interleave(std::vector<ResolvedAddress> addrs);
    static int start_attempt(const ResolvedAddress& addr);
    static void finish_socket(int fd);
};

} // namespace tollgate

#endif // DIALER_HPP
