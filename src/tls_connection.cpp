#include "tls_connection.hpp"
#include "errors.hpp"
#include <mbedtls/net_sockets.h>
#include <mbedtls/ssl.h>
#include <mbedtls/entropy.h>
#include <mbedtls/ctr_drbg.h>
#include <mbedtls/error.h>
#include <mbedtls/x509_crt.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace tollgate {

class TLSConnection::Impl {
public:
    mbedtls_ssl_context ssl;
    mbedtls_ssl_config conf;
    mbedtls_entropy_context entropy;
    mbedtls_ctr_drbg_context ctr_drbg;
    mbedtls_x509_crt cacert;

    // mbedtls keeps pointers to these for the lifetime of conf
    std::vector<std::string> alpn_names;
    std::vector<const char*> alpn_list;

    Impl() {
        mbedtls_ssl_init(&ssl);
        mbedtls_ssl_config_init(&conf);
        mbedtls_entropy_init(&entropy);
        mbedtls_ctr_drbg_init(&ctr_drbg);
        mbedtls_x509_crt_init(&cacert);
    }

    ~Impl() {
        mbedtls_ssl_free(&ssl);
        mbedtls_ssl_config_free(&conf);
        mbedtls_entropy_free(&entropy);
        mbedtls_ctr_drbg_free(&ctr_drbg);
        mbedtls_x509_crt_free(&cacert);
    }
};

static std::string tls_error(const char* what, int ret) {
    char buf[160];
    mbedtls_strerror(ret, buf, sizeof(buf));
    return std::string(what) + ": " + buf;
}

// The socket is blocking with SO_RCVTIMEO / SO_SNDTIMEO, so EAGAIN means
// the timeout expired.
static int ssl_send(void* ctx, const unsigned char* buf, size_t len) {
    int fd = *static_cast<int*>(ctx);
    ssize_t ret;
    do {
        ret = ::send(fd, buf, len, MSG_NOSIGNAL);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return MBEDTLS_ERR_SSL_TIMEOUT;
        }
        return MBEDTLS_ERR_NET_SEND_FAILED;
    }
    return static_cast<int>(ret);
}

static int ssl_recv(void* ctx, unsigned char* buf, size_t len) {
    int fd = *static_cast<int*>(ctx);
    ssize_t ret;
    do {
        ret = ::recv(fd, buf, len, 0);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return MBEDTLS_ERR_SSL_TIMEOUT;
        }
        return MBEDTLS_ERR_NET_RECV_FAILED;
    }
    if (ret == 0) {
        return MBEDTLS_ERR_NET_CONN_RESET;
    }
    return static_cast<int>(ret);
}

static bool load_system_ca(mbedtls_x509_crt* cacert) {
    const char* ca_files[] = {
        "/etc/ssl/certs/ca-certificates.crt",   // Debian/Ubuntu
        "/etc/pki/tls/certs/ca-bundle.crt",     // RHEL/CentOS
        "/etc/ssl/cert.pem",                    // Alpine, macOS
        nullptr
    };
    for (int i = 0; ca_files[i] != nullptr; i++) {
        if (mbedtls_x509_crt_parse_file(cacert, ca_files[i]) == 0) {
            return true;
        }
    }

    const char* ca_paths[] = {
        "/etc/ssl/certs",
        "/etc/pki/tls/certs",
        nullptr
    };
    for (int i = 0; ca_paths[i] != nullptr; i++) {
        if (mbedtls_x509_crt_parse_path(cacert, ca_paths[i]) >= 0) {
            return true;
        }
    }
    return false;
}

TLSConnection::TLSConnection(int socket_fd, const std::string& hostname, bool verify_peer)
    : impl_(std::make_unique<Impl>()),
      socket_fd_(socket_fd),
      hostname_(hostname),
      verify_peer_(verify_peer),
      connected_(false) {
}

TLSConnection::~TLSConnection() {
    close();
}

void TLSConnection::handshake(const std::vector<std::string>& alpn_protocols) {
    const char* pers = "tollgate";

    int ret = mbedtls_ctr_drbg_seed(&impl_->ctr_drbg, mbedtls_entropy_func,
                                    &impl_->entropy,
                                    reinterpret_cast<const unsigned char*>(pers),
                                    std::strlen(pers));
    if (ret != 0) {
        throw TransportError(TransportErrorKind::TlsFailure, tls_error("rng seed", ret));
    }

    bool ca_loaded = load_system_ca(&impl_->cacert);
    if (verify_peer_ && !ca_loaded) {
        throw TransportError(TransportErrorKind::TlsFailure, "no CA certificates found");
    }

    ret = mbedtls_ssl_config_defaults(&impl_->conf,
                                      MBEDTLS_SSL_IS_CLIENT,
                                      MBEDTLS_SSL_TRANSPORT_STREAM,
                                      MBEDTLS_SSL_PRESET_DEFAULT);
    if (ret != 0) {
        throw TransportError(TransportErrorKind::TlsFailure, tls_error("config", ret));
    }

    // TLS 1.2 minimum
    mbedtls_ssl_conf_min_version(&impl_->conf, MBEDTLS_SSL_MAJOR_VERSION_3,
                                 MBEDTLS_SSL_MINOR_VERSION_3);

    mbedtls_ssl_conf_authmode(&impl_->conf,
                              verify_peer_ ? MBEDTLS_SSL_VERIFY_REQUIRED : MBEDTLS_SSL_VERIFY_NONE);
    mbedtls_ssl_conf_ca_chain(&impl_->conf, &impl_->cacert, nullptr);
    mbedtls_ssl_conf_rng(&impl_->conf, mbedtls_ctr_drbg_random, &impl_->ctr_drbg);

    if (!alpn_protocols.empty()) {
        impl_->alpn_names = alpn_protocols;
        impl_->alpn_list.clear();
        for (const auto& name : impl_->alpn_names) {
            impl_->alpn_list.push_back(name.c_str());
        }
        impl_->alpn_list.push_back(nullptr);

        ret = mbedtls_ssl_conf_alpn_protocols(&impl_->conf, impl_->alpn_list.data());
        if (ret != 0) {
            throw TransportError(TransportErrorKind::TlsFailure, tls_error("alpn", ret));
        }
    }

    ret = mbedtls_ssl_setup(&impl_->ssl, &impl_->conf);
    if (ret != 0) {
        throw TransportError(TransportErrorKind::TlsFailure, tls_error("setup", ret));
    }

    // SNI
    mbedtls_ssl_set_hostname(&impl_->ssl, hostname_.c_str());
    mbedtls_ssl_set_bio(&impl_->ssl, &socket_fd_, ssl_send, ssl_recv, nullptr);

    while ((ret = mbedtls_ssl_handshake(&impl_->ssl)) != 0) {
        if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
            continue;
        }
        if (ret == MBEDTLS_ERR_SSL_TIMEOUT) {
            throw TransportError(TransportErrorKind::ConnectTimeout, "TLS handshake with " + hostname_);
        }
        throw TransportError(TransportErrorKind::TlsFailure,
                             tls_error(("handshake with " + hostname_).c_str(), ret));
    }

    const char* selected = mbedtls_ssl_get_alpn_protocol(&impl_->ssl);
    alpn_protocol_ = selected ? selected : "";
    connected_ = true;
}

size_t TLSConnection::send(const void* data, size_t len) {
    if (!connected_) {
        throw TransportError(TransportErrorKind::ConnectionClosed, "TLS session not established");
    }

    const unsigned char* buf = static_cast<const unsigned char*>(data);
    size_t written = 0;

    while (written < len) {
        int ret = mbedtls_ssl_write(&impl_->ssl, buf + written, len - written);
        if (ret < 0) {
            if (ret == MBEDTLS_ERR_SSL_WANT_WRITE || ret == MBEDTLS_ERR_SSL_WANT_READ) {
                continue;
            }
            if (ret == MBEDTLS_ERR_SSL_TIMEOUT) {
                throw TransportError(TransportErrorKind::WriteTimeout, hostname_);
            }
            throw TransportError(TransportErrorKind::SendFailed, tls_error("write", ret));
        }
        written += static_cast<size_t>(ret);
    }

    return written;
}

size_t TLSConnection::recv(void* data, size_t len) {
    if (!connected_) {
        throw TransportError(TransportErrorKind::ConnectionClosed, "TLS session not established");
    }

    unsigned char* buf = static_cast<unsigned char*>(data);
    while (true) {
        int ret = mbedtls_ssl_read(&impl_->ssl, buf, len);
        if (ret >= 0) {
            return static_cast<size_t>(ret);
        }

        switch (ret) {
            case MBEDTLS_ERR_SSL_WANT_READ:
            case MBEDTLS_ERR_SSL_WANT_WRITE:
                continue;
            case MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY:
            case MBEDTLS_ERR_NET_CONN_RESET:
                return 0;
            case MBEDTLS_ERR_SSL_TIMEOUT:
                throw TransportError(TransportErrorKind::ReadTimeout, hostname_);
            default:
                throw TransportError(TransportErrorKind::ConnectionClosed, tls_error("read", ret));
        }
    }
}

void TLSConnection::close() {
    if (connected_) {
        mbedtls_ssl_close_notify(&impl_->ssl);
        connected_ = false;
    }
}

} // namespace tollgate
