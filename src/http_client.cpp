#include "http_client.hpp"
#include "compression.hpp"
#include "errors.hpp"
#include "logging.hpp"
#ifdef HAVE_NGHTTP2
#include "http2_session.hpp"
#endif
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace tollgate {

namespace {

constexpr size_t kReadChunk = 65536;
constexpr size_t kMaxHeaderBytes = 1024 * 1024;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

bool contains_token(const std::string& value, const std::string& token) {
    return to_lower(value).find(token) != std::string::npos;
}

[[noreturn]] void malformed(const std::string& what) {
    throw TransportError(TransportErrorKind::MalformedResponse, what);
}

// Buffered reader over one pooled connection
class WireReader {
public:
    explicit WireReader(PooledConnection& conn) : conn_(conn) {}

    // CRLF (or bare LF) terminated line without its terminator
    std::string read_line() {
        while (true) {
            size_t nl = buffer_.find('\n', pos_);
            if (nl != std::string::npos) {
                size_t end = nl;
                if (end > pos_ && buffer_[end - 1] == '\r') end--;
                std::string line = buffer_.substr(pos_, end - pos_);
                pos_ = nl + 1;
                return line;
            }
            if (buffer_.size() - pos_ > kMaxHeaderBytes) {
                malformed("header line too long");
            }
            if (!fill()) {
                if (total_ == 0) {
                    throw TransportError(TransportErrorKind::ConnectionClosed,
                                         "server closed the connection before responding");
                }
                malformed("connection closed mid-line");
            }
        }
    }

    std::string read_exact(size_t n) {
        while (buffer_.size() - pos_ < n) {
            if (!fill()) {
                malformed("connection closed after " + std::to_string(buffer_.size() - pos_) +
                          " of " + std::to_string(n) + " body bytes");
            }
        }
        std::string out = buffer_.substr(pos_, n);
        pos_ += n;
        return out;
    }

    std::string read_to_close() {
        while (fill()) {
        }
        std::string out = buffer_.substr(pos_);
        pos_ = buffer_.size();
        return out;
    }

    size_t total() const { return total_; }

private:
    bool fill() {
        if (pos_ > 0 && pos_ == buffer_.size()) {
            buffer_.clear();
            pos_ = 0;
        }
        char chunk[kReadChunk];
        size_t n = conn_.recv_some(chunk, sizeof(chunk));
        if (n == 0) {
            return false;
        }
        buffer_.append(chunk, n);
        total_ += n;
        return true;
    }

    PooledConnection& conn_;
    std::string buffer_;
    size_t pos_ = 0;
    size_t total_ = 0;
};

bool parse_size(const std::string& text, int base, size_t& out) {
    std::string digits = trim(text);
    if (digits.empty()) return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(digits.c_str(), &end, base);
    if (errno != 0 || end == digits.c_str() || *end != '\0') return false;
    out = static_cast<size_t>(value);
    return true;
}

bool has_no_body(const std::string& method, int status) {
    return method == "HEAD" || (status >= 100 && status < 200) || status == 204 || status == 304;
}

} // namespace

std::optional<URL> URL::parse(const std::string& url) {
    URL result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    result.scheme = to_lower(url.substr(0, scheme_end));
    if (result.scheme != "http" && result.scheme != "https") {
        return std::nullopt;
    }

    size_t pos = scheme_end + 3;

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.length();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    size_t at = host_port.rfind('@');
    if (at != std::string::npos) {
        host_port = host_port.substr(at + 1);
    }

    std::string port_str;
    if (!host_port.empty() && host_port[0] == '[') {
        // IPv6 literal
        size_t close = host_port.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        result.host = host_port.substr(1, close - 1);
        if (close + 1 < host_port.size()) {
            if (host_port[close + 1] != ':') return std::nullopt;
            port_str = host_port.substr(close + 2);
        }
    } else {
        size_t port_delim = host_port.find(':');
        if (port_delim != std::string::npos) {
            result.host = host_port.substr(0, port_delim);
            port_str = host_port.substr(port_delim + 1);
        } else {
            result.host = host_port;
        }
    }

    if (result.host.empty()) {
        return std::nullopt;
    }
    result.host = to_lower(result.host);

    if (!port_str.empty()) {
        size_t port = 0;
        if (!parse_size(port_str, 10, port) || port == 0 || port > 65535) {
            return std::nullopt;
        }
        result.port = static_cast<int>(port);
    } else {
        result.port = (result.scheme == "https") ? 443 : 80;
    }

    std::string rest = url.substr(host_end);
    size_t fragment = rest.find('#');
    if (fragment != std::string::npos) {
        rest = rest.substr(0, fragment);
    }

    size_t query_start = rest.find('?');
    if (query_start != std::string::npos) {
        result.path = rest.substr(0, query_start);
        result.query = rest.substr(query_start + 1);
    } else {
        result.path = rest;
    }
    if (result.path.empty()) {
        result.path = "/";
    }

    return result;
}

bool URL::is_default_port() const {
    return (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
}

std::string URL::authority() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (!is_default_port()) {
        h += ":" + std::to_string(port);
    }
    return h;
}

std::string URL::target() const {
    return query.empty() ? path : path + "?" + query;
}

std::string URL::to_string() const {
    return scheme + "://" + authority() + target();
}

std::string Response::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

class HttpClient::Impl {
public:
    explicit Impl(const ClientLimits& limits)
        : limits_(limits), pool_(limits) {
    }

    Response execute(const Request& req);

    ClientLimits limits_;
    ConnectionPool pool_;
    std::atomic<bool> closed_{false};

private:
    std::string build_request(const Request& req, const URL& url) const;
    Response exchange_http1(PooledConnection& conn, const Request& req, const URL& url,
                            bool& reusable) const;
#ifdef HAVE_NGHTTP2
    Response exchange_http2(PooledConnection& conn, const Request& req, const URL& url,
                            bool& reusable) const;
#endif
    void decode_body(Response& resp) const;
};

std::string HttpClient::Impl::build_request(const Request& req, const URL& url) const {
    std::string result;
    result.reserve(512);

    result += req.method;
    result += " ";
    result += url.target();
    result += " HTTP/1.1\r\n";

    result += "Host: ";
    result += url.authority();
    result += "\r\n";

    bool has_user_agent = false;
    bool has_connection = false;
    bool has_accept = false;
    bool has_accept_encoding = false;

    for (const auto& [key, value] : req.headers) {
        std::string lower_key = to_lower(key);

        // Framing is ours
        if (lower_key == "host" || lower_key == "content-length" ||
            lower_key == "transfer-encoding") {
            continue;
        }

        if (lower_key == "user-agent") has_user_agent = true;
        if (lower_key == "connection") has_connection = true;
        if (lower_key == "accept") has_accept = true;
        if (lower_key == "accept-encoding") has_accept_encoding = true;

        result += key;
        result += ": ";
        result += value;
        result += "\r\n";
    }

    if (!has_user_agent) {
        result += "User-Agent: ";
        result += limits_.user_agent;
        result += "\r\n";
    }

    if (!has_connection) {
        result += "Connection: keep-alive\r\n";
    }

    if (!has_accept) {
        result += "Accept: */*\r\n";
    }

    if (!has_accept_encoding && limits_.compression) {
        std::string encodings = Compression::accept_encoding();
        if (encodings != "identity") {
            result += "Accept-Encoding: ";
            result += encodings;
            result += "\r\n";
        }
    }

    if (!req.body.empty() || req.method == "POST" || req.method == "PUT" || req.method == "PATCH") {
        result += "Content-Length: ";
        result += std::to_string(req.body.size());
        result += "\r\n";
    }

    result += "\r\n";
    return result;
}

Response HttpClient::Impl::exchange_http1(PooledConnection& conn, const Request& req,
                                          const URL& url, bool& reusable) const {
    std::string head = build_request(req, url);
    if (!req.body.empty()) {
        head += req.body;
    }
    conn.send_all(head.data(), head.size());

    WireReader reader(conn);
    Response resp;
    std::string version;

    // Skip interim 1xx responses (101 is not expected without Upgrade)
    while (true) {
        std::string status_line = reader.read_line();
        if (status_line.empty()) {
            continue;
        }

        size_t sp1 = status_line.find(' ');
        if (sp1 == std::string::npos || status_line.compare(0, 5, "HTTP/") != 0) {
            malformed("bad status line: " + status_line.substr(0, 64));
        }
        version = status_line.substr(0, sp1);

        size_t sp2 = status_line.find(' ', sp1 + 1);
        std::string code = status_line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos
                                                                                 : sp2 - sp1 - 1);
        size_t status = 0;
        if (code.size() != 3 || !parse_size(code, 10, status)) {
            malformed("bad status code: " + code);
        }
        resp.status_code = static_cast<int>(status);
        resp.status_message = sp2 == std::string::npos ? "" : status_line.substr(sp2 + 1);

        resp.headers.clear();
        size_t header_bytes = 0;
        while (true) {
            std::string line = reader.read_line();
            if (line.empty()) break;

            header_bytes += line.size();
            if (header_bytes > kMaxHeaderBytes) {
                malformed("response headers too large");
            }

            size_t colon = line.find(':');
            if (colon == std::string::npos) {
                malformed("bad header line");
            }
            std::string key = to_lower(trim(line.substr(0, colon)));
            std::string value = trim(line.substr(colon + 1));

            auto it = resp.headers.find(key);
            if (it == resp.headers.end()) {
                resp.headers.emplace(std::move(key), std::move(value));
            } else {
                it->second += ", " + value;
            }
        }

        if (resp.status_code >= 100 && resp.status_code < 200 && resp.status_code != 101) {
            continue;
        }
        break;
    }

    std::string connection = resp.header("connection");
    bool keep_alive = version == "HTTP/1.1" ? !contains_token(connection, "close")
                                            : contains_token(connection, "keep-alive");
    bool framed = true;

    if (!has_no_body(req.method, resp.status_code)) {
        std::string transfer_encoding = resp.header("transfer-encoding");
        std::string content_length = resp.header("content-length");

        if (contains_token(transfer_encoding, "chunked")) {
            while (true) {
                std::string size_line = reader.read_line();
                size_t semi = size_line.find(';');
                if (semi != std::string::npos) {
                    size_line = size_line.substr(0, semi);
                }
                size_t chunk_size = 0;
                if (!parse_size(size_line, 16, chunk_size)) {
                    malformed("bad chunk size: " + size_line.substr(0, 32));
                }
                if (chunk_size == 0) {
                    // Trailers
                    while (!reader.read_line().empty()) {
                    }
                    break;
                }
                resp.body += reader.read_exact(chunk_size);
                if (!reader.read_line().empty()) {
                    malformed("missing CRLF after chunk");
                }
            }
        } else if (!content_length.empty()) {
            size_t length = 0;
            if (!parse_size(content_length, 10, length)) {
                malformed("bad content-length: " + content_length);
            }
            resp.body = reader.read_exact(length);
        } else {
            resp.body = reader.read_to_close();
            framed = false;
        }
    }

    resp.bytes_received = reader.total();
    reusable = framed && keep_alive;
    return resp;
}

#ifdef HAVE_NGHTTP2
Response HttpClient::Impl::exchange_http2(PooledConnection& conn, const Request& req,
                                          const URL& url, bool& reusable) const {
    Http2Request h2req;
    h2req.method = req.method;
    h2req.scheme = url.scheme;
    h2req.authority = url.authority();
    h2req.path = url.target();
    h2req.body = req.body;

    bool has_user_agent = false;
    bool has_accept = false;
    bool has_accept_encoding = false;
    for (const auto& [key, value] : req.headers) {
        std::string lower_key = to_lower(key);
        if (lower_key == "content-length") continue;
        if (lower_key == "user-agent") has_user_agent = true;
        if (lower_key == "accept") has_accept = true;
        if (lower_key == "accept-encoding") has_accept_encoding = true;
        h2req.headers.emplace_back(lower_key, value);
    }
    if (!has_user_agent) h2req.headers.emplace_back("user-agent", limits_.user_agent);
    if (!has_accept) h2req.headers.emplace_back("accept", "*/*");
    if (!has_accept_encoding && limits_.compression) {
        std::string encodings = Compression::accept_encoding();
        if (encodings != "identity") h2req.headers.emplace_back("accept-encoding", encodings);
    }
    if (!req.body.empty()) {
        h2req.headers.emplace_back("content-length", std::to_string(req.body.size()));
    }

    Http2Response h2resp = conn.http2()->request(h2req);

    Response resp;
    resp.status_code = h2resp.status_code;
    resp.headers = std::move(h2resp.headers);
    resp.body = std::move(h2resp.body);
    resp.bytes_received = resp.body.size();
    resp.used_http2 = true;

    reusable = conn.is_alive();
    return resp;
}
#endif

void HttpClient::Impl::decode_body(Response& resp) const {
    std::string content_encoding = resp.header("content-encoding");
    if (content_encoding.empty() || resp.body.empty()) {
        return;
    }

    ContentEncoding encoding = Compression::parse_encoding(content_encoding);
    if (encoding == ContentEncoding::Identity) {
        return;
    }
    if (!Compression::supported(encoding)) {
        malformed("unsupported content-encoding: " + content_encoding);
    }

    auto decoded = Compression::decode(resp.body, encoding);
    if (!decoded) {
        malformed("could not decode " + content_encoding + " body");
    }
    resp.body = std::move(*decoded);
    resp.was_compressed = true;
}

Response HttpClient::Impl::execute(const Request& req) {
    if (closed_) {
        throw TransportError(TransportErrorKind::ClientClosed, "client is closed");
    }

    auto url = URL::parse(req.url);
    if (!url) {
        throw TransportError(TransportErrorKind::InvalidUrl, req.url);
    }

    auto start = std::chrono::steady_clock::now();
    auto conn = pool_.acquire(url->host, url->port, url->scheme == "https");
    bool reused = conn->reused;

    conn->set_timeouts(req.timeout.value_or(limits_.read_timeout), limits_.write_timeout);

    Response resp;
    bool reusable = false;
    try {
#ifdef HAVE_NGHTTP2
        if (conn->is_http2()) {
            resp = exchange_http2(*conn, req, *url, reusable);
        } else {
            resp = exchange_http1(*conn, req, *url, reusable);
        }
#else
        resp = exchange_http1(*conn, req, *url, reusable);
#endif
    } catch (const std::exception&) {
        pool_.release(conn, false);
        throw;
    }

    pool_.release(conn, reusable);

    decode_body(resp);
    resp.reused_connection = reused;
    resp.elapsed_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    logging::debug(req.method, " ", url->to_string(), " -> ", resp.status_code,
                   " (", resp.elapsed_time.count(), " ms",
                   resp.used_http2 ? ", h2" : "", resp.reused_connection ? ", reused" : "", ")");
    return resp;
}

HttpClient::HttpClient(const ClientLimits& limits)
    : impl_(std::make_unique<Impl>(limits)) {
}

HttpClient::~HttpClient() {
    close();
}

Response HttpClient::request(const Request& req) {
    return impl_->execute(req);
}

void HttpClient::close() {
    if (impl_->closed_.exchange(true)) {
        return;
    }
    impl_->pool_.close_all();
    logging::debug("http client closed");
}

bool HttpClient::is_closed() const {
    return impl_->closed_;
}

PoolStats HttpClient::pool_stats() const {
    return impl_->pool_.stats();
}

const ClientLimits& HttpClient::limits() const {
    return impl_->limits_;
}

} // namespace tollgate
