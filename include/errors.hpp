#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace tollgate {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class TransportErrorKind {
    InvalidUrl,
    ResolveFailed,
    ConnectFailed,
    ConnectTimeout,
    TlsFailure,
    SendFailed,
    WriteTimeout,
    ReadTimeout,
    ConnectionClosed,
    MalformedResponse,
    PoolTimeout,
    ClientClosed,
    Protocol
};

inline const char* to_string(TransportErrorKind kind);

// Failure of the physical exchange (socket, TLS, framing, pool).
class TransportError : public Error {
public:
    TransportError(TransportErrorKind kind, const std::string& message)
        : Error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

    TransportErrorKind kind() const { return kind_; }

private:
    TransportErrorKind kind_;
};

// Non-2xx response. A 429 is the provider's rate-limit signal.
class HttpStatusError : public Error {
public:
    HttpStatusError(int status_code, const std::string& url, std::string body,
                    std::optional<std::chrono::duration<double>> retry_after = std::nullopt)
        : Error("HTTP " + std::to_string(status_code) + " from " + url),
          status_code_(status_code),
          body_(std::move(body)),
          retry_after_(retry_after) {}

    int status_code() const { return status_code_; }
    const std::string& body() const { return body_; }
    std::optional<std::chrono::duration<double>> retry_after() const { return retry_after_; }
    bool is_rate_limited() const { return status_code_ == 429; }

private:
    int status_code_;
    std::string body_;
    std::optional<std::chrono::duration<double>> retry_after_;
};

class ResponseParseError : public Error {
public:
    using Error::Error;
};

class TimeoutError : public Error {
public:
    using Error::Error;
};

class BatchTimeout : public TimeoutError {
public:
    using TimeoutError::TimeoutError;
};

class DedupWaitTimeout : public TimeoutError {
public:
    using TimeoutError::TimeoutError;
};

class BatchError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

inline const char* to_string(TransportErrorKind kind) {
    switch (kind) {
        case TransportErrorKind::InvalidUrl:        return "invalid url";
        case TransportErrorKind::ResolveFailed:     return "resolve failed";
        case TransportErrorKind::ConnectFailed:     return "connect failed";
        case TransportErrorKind::ConnectTimeout:    return "connect timeout";
        case TransportErrorKind::TlsFailure:        return "tls failure";
        case TransportErrorKind::SendFailed:        return "send failed";
        case TransportErrorKind::WriteTimeout:      return "write timeout";
        case TransportErrorKind::ReadTimeout:       return "read timeout";
        case TransportErrorKind::ConnectionClosed:  return "connection closed";
        case TransportErrorKind::MalformedResponse: return "malformed response";
        case TransportErrorKind::PoolTimeout:       return "pool timeout";
        case TransportErrorKind::ClientClosed:      return "client closed";
        case TransportErrorKind::Protocol:          return "protocol error";
    }
    return "transport error";
}

} // namespace tollgate
