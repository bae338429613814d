#include "compression.hpp"
#include "connection_pool.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "loopback_server.hpp"

#include <gtest/gtest.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

#include <chrono>
#include <functional>
#include <thread>

using namespace tollgate;
using tollgate::test_support::LoopbackServer;
using tollgate::test_support::ReceivedRequest;

namespace {

ClientLimits test_limits() {
    ClientLimits limits;
    limits.connect_timeout = Seconds(2.0);
    limits.read_timeout = Seconds(2.0);
    limits.write_timeout = Seconds(2.0);
    limits.pool_timeout = Seconds(0.5);
    return limits;
}

// A port with nothing listening on it
int unused_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

TransportErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const TransportError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a TransportError";
    return TransportErrorKind::Protocol;
}

} // namespace

// ──────────────────────────────────────────────────────────────────────────────
// URL
// ──────────────────────────────────────────────────────────────────────────────

TEST(UrlTest, ParsesHostPortPathAndQuery) {
    auto url = URL::parse("http://Example.COM:8080/a/b?x=1&y=2#frag");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "http");
    EXPECT_EQ(url->host, "example.com");
    EXPECT_EQ(url->port, 8080);
    EXPECT_EQ(url->path, "/a/b");
    EXPECT_EQ(url->query, "x=1&y=2");
    EXPECT_EQ(url->target(), "/a/b?x=1&y=2");
    EXPECT_EQ(url->to_string(), "http://example.com:8080/a/b?x=1&y=2");
}

TEST(UrlTest, DefaultPortsAreOmittedFromAuthority) {
    auto https = URL::parse("https://api.example.com");
    ASSERT_TRUE(https.has_value());
    EXPECT_EQ(https->port, 443);
    EXPECT_EQ(https->path, "/");
    EXPECT_TRUE(https->is_default_port());
    EXPECT_EQ(https->authority(), "api.example.com");

    auto http = URL::parse("http://api.example.com:80/x");
    ASSERT_TRUE(http.has_value());
    EXPECT_EQ(http->to_string(), "http://api.example.com/x");
}

TEST(UrlTest, Ipv6Literal) {
    auto url = URL::parse("http://[::1]:9000/ping");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "::1");
    EXPECT_EQ(url->port, 9000);
    EXPECT_EQ(url->authority(), "[::1]:9000");
}

TEST(UrlTest, RejectsUnsupportedOrMalformed) {
    EXPECT_FALSE(URL::parse("ftp://example.com/file").has_value());
    EXPECT_FALSE(URL::parse("example.com/no-scheme").has_value());
    EXPECT_FALSE(URL::parse("http://:80/").has_value());
    EXPECT_FALSE(URL::parse("http://host:0/").has_value());
    EXPECT_FALSE(URL::parse("http://host:70000/").has_value());
    EXPECT_FALSE(URL::parse("http://host:12ab/").has_value());
    EXPECT_FALSE(URL::parse("http://[::1/").has_value());
}

// ──────────────────────────────────────────────────────────────────────────────
// HttpClient against the loopback server
// ──────────────────────────────────────────────────────────────────────────────

TEST(HttpClientTest, GetWithContentLength) {
    LoopbackServer server([](const ReceivedRequest& req) {
        return LoopbackServer::response(200, "hello " + req.target, {{"X-Trace", "abc"}});
    });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/greet?name=x");
    Response resp = client.request(req);

    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.status_message, "OK");
    EXPECT_EQ(resp.body, "hello /greet?name=x");
    EXPECT_EQ(resp.header("X-TRACE"), "abc");
    EXPECT_TRUE(resp.ok());
    EXPECT_FALSE(resp.used_http2);
    EXPECT_GT(resp.bytes_received, resp.body.size());

    auto received = server.requests();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].method, "GET");
    EXPECT_EQ(received[0].header("host"), "127.0.0.1:" + std::to_string(server.port()));
    EXPECT_EQ(received[0].header("user-agent"), "tollgate/1.0");
    EXPECT_EQ(received[0].header("connection"), "keep-alive");
}

TEST(HttpClientTest, KeepAliveReusesConnection) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::response(200, "ok");
    });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/");
    Response first = client.request(req);
    Response second = client.request(req);

    EXPECT_FALSE(first.reused_connection);
    EXPECT_TRUE(second.reused_connection);
    EXPECT_EQ(server.connections_accepted(), 1);

    PoolStats stats = client.pool_stats();
    EXPECT_EQ(stats.created, 1u);
    EXPECT_EQ(stats.reused, 1u);
    EXPECT_EQ(stats.idle, 1u);
    EXPECT_EQ(stats.in_use, 0u);
}

TEST(HttpClientTest, ChunkedBodyWithTrailers) {
    LoopbackServer server([](const ReceivedRequest&) {
        return std::string("HTTP/1.1 200 OK\r\n"
                           "Transfer-Encoding: chunked\r\n"
                           "\r\n"
                           "5;ext=1\r\nhello\r\n"
                           "7\r\n, world\r\n"
                           "0\r\n"
                           "X-Checksum: 42\r\n"
                           "\r\n");
    });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/chunked");
    Response resp = client.request(req);
    EXPECT_EQ(resp.body, "hello, world");

    // The trailer was consumed, so the connection stays usable
    Response again = client.request(req);
    EXPECT_EQ(again.body, "hello, world");
    EXPECT_TRUE(again.reused_connection);
}

TEST(HttpClientTest, BodyReadUntilCloseIsNotReused) {
    LoopbackServer server([](const ReceivedRequest&) {
        return std::string("HTTP/1.1 200 OK\r\nConnection: close\r\n\r\nuntil the end");
    });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/");
    EXPECT_EQ(client.request(req).body, "until the end");
    EXPECT_EQ(client.request(req).body, "until the end");
    EXPECT_EQ(server.connections_accepted(), 2);
    EXPECT_EQ(client.pool_stats().reused, 0u);
}

TEST(HttpClientTest, HeadAndNoContentHaveNoBody) {
    LoopbackServer server([](const ReceivedRequest& req) {
        if (req.method == "HEAD") {
            return std::string("HTTP/1.1 200 OK\r\nContent-Length: 1234\r\n\r\n");
        }
        return std::string("HTTP/1.1 204 No Content\r\n\r\n");
    });
    HttpClient client(test_limits());

    Request head;
    head.method = "HEAD";
    head.url = server.url("/");
    Response h = client.request(head);
    EXPECT_EQ(h.status_code, 200);
    EXPECT_TRUE(h.body.empty());

    Request del;
    del.method = "DELETE";
    del.url = server.url("/item");
    Response d = client.request(del);
    EXPECT_EQ(d.status_code, 204);
    EXPECT_TRUE(d.body.empty());
    EXPECT_TRUE(d.reused_connection);
}

TEST(HttpClientTest, InterimResponsesAreSkipped) {
    LoopbackServer server([](const ReceivedRequest&) {
        return std::string("HTTP/1.1 100 Continue\r\n\r\n") +
               LoopbackServer::response(201, "created", {}, "Created");
    });
    HttpClient client(test_limits());

    Request req;
    req.method = "POST";
    req.url = server.url("/items");
    req.body = "{\"a\":1}";
    Response resp = client.request(req);
    EXPECT_EQ(resp.status_code, 201);
    EXPECT_EQ(resp.body, "created");
}

TEST(HttpClientTest, PostSendsBodyWithLength) {
    LoopbackServer server([](const ReceivedRequest& req) {
        return LoopbackServer::response(200, req.body);
    });
    HttpClient client(test_limits());

    Request req;
    req.method = "POST";
    req.url = server.url("/echo");
    req.headers["Content-Type"] = "application/json";
    req.headers["Content-Length"] = "999";  // framing headers are ours
    req.body = "{\"k\":\"v\"}";
    Response resp = client.request(req);

    EXPECT_EQ(resp.body, req.body);
    auto received = server.requests();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].header("content-length"), std::to_string(req.body.size()));
    EXPECT_EQ(received[0].header("content-type"), "application/json");
}

TEST(HttpClientTest, ErrorStatusIsAResponse) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::response(404, "missing", {}, "Not Found");
    });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/nope");
    Response resp = client.request(req);
    EXPECT_EQ(resp.status_code, 404);
    EXPECT_EQ(resp.status_message, "Not Found");
    EXPECT_FALSE(resp.ok());
}

#ifdef HAVE_ZLIB
TEST(HttpClientTest, GzipBodyIsDecoded) {
    std::string payload(4096, 'z');
    LoopbackServer server([&](const ReceivedRequest& req) {
        EXPECT_NE(req.header("accept-encoding").find("gzip"), std::string::npos);
        auto gz = Compression::encode(payload, ContentEncoding::Gzip);
        return LoopbackServer::response(200, gz.value_or(""), {{"Content-Encoding", "gzip"}});
    });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/big");
    Response resp = client.request(req);
    EXPECT_EQ(resp.body, payload);
    EXPECT_TRUE(resp.was_compressed);
    EXPECT_LT(resp.bytes_received, payload.size());
}

TEST(HttpClientTest, CorruptCompressedBodyIsMalformed) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::response(200, "definitely not gzip", {{"Content-Encoding", "gzip"}});
    });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/");
    EXPECT_EQ(kind_of([&] { client.request(req); }), TransportErrorKind::MalformedResponse);
}
#endif

TEST(HttpClientTest, UnknownEncodingIsMalformed) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::response(200, "xx", {{"Content-Encoding", "zstd"}});
    });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/");
    EXPECT_EQ(kind_of([&] { client.request(req); }), TransportErrorKind::MalformedResponse);
}

TEST(HttpClientTest, TruncatedBodyIsMalformed) {
    LoopbackServer server([](const ReceivedRequest&) {
        return std::string("HTTP/1.1 200 OK\r\nContent-Length: 100\r\nConnection: close\r\n\r\nshort");
    });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/");
    EXPECT_EQ(kind_of([&] { client.request(req); }), TransportErrorKind::MalformedResponse);
}

TEST(HttpClientTest, ServerHangupIsConnectionClosed) {
    LoopbackServer server([](const ReceivedRequest&) { return std::string(); });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/");
    EXPECT_EQ(kind_of([&] { client.request(req); }), TransportErrorKind::ConnectionClosed);
    EXPECT_EQ(client.pool_stats().idle, 0u);
}

TEST(HttpClientTest, PerRequestReadTimeout) {
    LoopbackServer server([](const ReceivedRequest&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        return LoopbackServer::response(200, "late");
    });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/slow");
    req.timeout = Seconds(0.1);
    EXPECT_EQ(kind_of([&] { client.request(req); }), TransportErrorKind::ReadTimeout);
}

TEST(HttpClientTest, InvalidUrl) {
    HttpClient client(test_limits());
    Request req;
    req.url = "ftp://example.com/";
    EXPECT_EQ(kind_of([&] { client.request(req); }), TransportErrorKind::InvalidUrl);
}

TEST(HttpClientTest, RefusedConnection) {
    HttpClient client(test_limits());
    Request req;
    req.url = "http://127.0.0.1:" + std::to_string(unused_port()) + "/";
    EXPECT_EQ(kind_of([&] { client.request(req); }), TransportErrorKind::ConnectFailed);
}

TEST(HttpClientTest, ClosedClientRefusesRequests) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::response(200, "ok");
    });
    HttpClient client(test_limits());

    Request req;
    req.url = server.url("/");
    client.request(req);
    client.close();
    client.close();

    EXPECT_TRUE(client.is_closed());
    EXPECT_EQ(client.pool_stats().idle, 0u);
    EXPECT_EQ(kind_of([&] { client.request(req); }), TransportErrorKind::ClientClosed);
}

// ──────────────────────────────────────────────────────────────────────────────
// ConnectionPool
// ──────────────────────────────────────────────────────────────────────────────

TEST(ConnectionPoolTest, WaitsThenTimesOutAtCapacity) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::response(200, "ok");
    });
    ClientLimits limits = test_limits();
    limits.max_connections = 1;
    limits.max_keepalive_connections = 1;
    limits.pool_timeout = Seconds(0.2);
    ConnectionPool pool(limits);

    auto held = pool.acquire("127.0.0.1", server.port(), false);
    ASSERT_NE(held, nullptr);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(kind_of([&] { pool.acquire("127.0.0.1", server.port(), false); }),
              TransportErrorKind::PoolTimeout);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(180));

    PoolStats stats = pool.stats();
    EXPECT_EQ(stats.waits, 1u);
    EXPECT_EQ(stats.timeouts, 1u);

    pool.release(held, true);
    auto again = pool.acquire("127.0.0.1", server.port(), false);
    EXPECT_EQ(again.get(), held.get());
    EXPECT_TRUE(again->reused);
    pool.release(again, true);
}

TEST(ConnectionPoolTest, ReleaseWakesWaiter) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::response(200, "ok");
    });
    ClientLimits limits = test_limits();
    limits.max_connections = 1;
    limits.max_keepalive_connections = 1;
    limits.pool_timeout = Seconds(2.0);
    ConnectionPool pool(limits);

    auto held = pool.acquire("127.0.0.1", server.port(), false);
    std::thread releaser([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        pool.release(held, true);
    });

    auto conn = pool.acquire("127.0.0.1", server.port(), false);
    releaser.join();
    EXPECT_NE(conn, nullptr);
    EXPECT_EQ(pool.stats().created, 1u);
    pool.release(conn, true);
}

TEST(ConnectionPoolTest, KeepaliveLimitClosesExtraConnections) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::response(200, "ok");
    });
    ClientLimits limits = test_limits();
    limits.max_connections = 3;
    limits.max_keepalive_connections = 1;
    ConnectionPool pool(limits);

    auto a = pool.acquire("127.0.0.1", server.port(), false);
    auto b = pool.acquire("127.0.0.1", server.port(), false);
    pool.release(a, true);
    pool.release(b, true);

    EXPECT_EQ(pool.stats().idle, 1u);
    EXPECT_FALSE(b->is_open());
}

TEST(ConnectionPoolTest, ExpiredIdleConnectionsAreCleaned) {
    LoopbackServer server([](const ReceivedRequest&) {
        return LoopbackServer::response(200, "ok");
    });
    ClientLimits limits = test_limits();
    limits.keepalive_expiry = Seconds(0.05);
    ConnectionPool pool(limits);

    auto conn = pool.acquire("127.0.0.1", server.port(), false);
    pool.release(conn, true);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_EQ(pool.cleanup_idle(), 1u);
    EXPECT_EQ(pool.stats().idle, 0u);
}

TEST(ConnectionPoolTest, ClosedPoolRejectsAcquire) {
    ConnectionPool pool(test_limits());
    pool.close_all();
    EXPECT_TRUE(pool.is_closed());
    EXPECT_EQ(kind_of([&] { pool.acquire("127.0.0.1", 1, false); }),
              TransportErrorKind::ClientClosed);
}

// ──────────────────────────────────────────────────────────────────────────────
// Compression
// ──────────────────────────────────────────────────────────────────────────────

TEST(CompressionTest, ParsesEncodingNames) {
    EXPECT_EQ(Compression::parse_encoding(""), ContentEncoding::Identity);
    EXPECT_EQ(Compression::parse_encoding("identity"), ContentEncoding::Identity);
    EXPECT_EQ(Compression::parse_encoding("GZIP"), ContentEncoding::Gzip);
    EXPECT_EQ(Compression::parse_encoding("x-gzip"), ContentEncoding::Gzip);
    EXPECT_EQ(Compression::parse_encoding("deflate"), ContentEncoding::Deflate);
    EXPECT_EQ(Compression::parse_encoding("br"), ContentEncoding::Brotli);
    EXPECT_EQ(Compression::parse_encoding("zstd"), ContentEncoding::Unsupported);
    EXPECT_EQ(Compression::parse_encoding(" Br\t"), ContentEncoding::Brotli);
    EXPECT_EQ(Compression::parse_encoding("g\xC3\xBCzip"), ContentEncoding::Unsupported);
    EXPECT_EQ(Compression::parse_encoding("gzip\xA0"), ContentEncoding::Unsupported);
    EXPECT_TRUE(Compression::supported(ContentEncoding::Identity));
    EXPECT_FALSE(Compression::supported(ContentEncoding::Unsupported));
}

#ifdef HAVE_BROTLI
TEST(CompressionTest, BrotliDecodesWhatItEncodes) {
    std::string text = "{\"items\":[1,2,3,4,5,6,7,8,9,10]}";
    auto encoded = Compression::encode(text, ContentEncoding::Brotli);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(Compression::decode(*encoded, ContentEncoding::Brotli), text);
    EXPECT_FALSE(Compression::decode("garbage", ContentEncoding::Brotli).has_value());
}
#endif
