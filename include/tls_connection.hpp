#ifndef TLS_CONNECTION_HPP
#define TLS_CONNECTION_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tollgate {

// Client side TLS over an already connected socket. Timeouts come from the
// socket's SO_RCVTIMEO / SO_SNDTIMEO.
class TLSConnection {
public:
    TLSConnection(int socket_fd, const std::string& hostname, bool verify_peer);
    ~TLSConnection();

    TLSConnection(const TLSConnection&) = delete;
    TLSConnection& operator=(const TLSConnection&) = delete;

    // Throws TransportError(TlsFailure) on failure
    void handshake(const std::vector<std::string>& alpn_protocols);

    // Writes everything or throws (WriteTimeout, SendFailed)
    size_t send(const void* data, size_t len);

    // 0 on orderly close; throws ReadTimeout or ConnectionClosed
    size_t recv(void* data, size_t len);

    // Protocol selected by ALPN, empty if none
    const std::string& alpn_protocol() const { return alpn_protocol_; }

    void close();

    bool is_connected() const { return connected_; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    int socket_fd_;
    std::string hostname_;
    bool verify_peer_;
    bool connected_;
    std::string alpn_protocol_;
};

} // namespace tollgate

#endif // TLS_CONNECTION_HPP
