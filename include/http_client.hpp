#pragma once

#include "config.hpp"
#include "connection_pool.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tollgate {

struct URL {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
    std::string query;

    // http and https only; std::nullopt on anything malformed
    static std::optional<URL> parse(const std::string& url);
    std::string to_string() const;

    // host[:port], port omitted when it is the scheme default
    std::string authority() const;

    // path[?query], what goes on the request line
    std::string target() const;

    bool is_default_port() const;
};

struct Request {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;

    // Overrides the client's read timeout
    std::optional<Seconds> timeout;
};

struct Response {
    int status_code = 0;
    std::string status_message;
    std::map<std::string, std::string> headers;  // names lower-cased
    std::string body;
    std::chrono::milliseconds elapsed_time{0};

    bool used_http2 = false;
    bool was_compressed = false;
    bool reused_connection = false;
    size_t bytes_received = 0;

    // Case-insensitive lookup, empty if absent
    std::string header(const std::string& name) const;
    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Pooled HTTP client. HTTP/1.1 keep-alive, HTTP/2 when ALPN picks h2.
// Safe for concurrent use.
class HttpClient {
public:
    explicit HttpClient(const ClientLimits& limits = ClientLimits());
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Any status code is a Response. Throws TransportError.
    Response request(const Request& req);

    void close();
    bool is_closed() const;

    PoolStats pool_stats() const;
    const ClientLimits& limits() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tollgate
