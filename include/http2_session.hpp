#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#ifdef HAVE_NGHTTP2
#include <nghttp2/nghttp2.h>
#endif

namespace tollgate {

struct Http2Request {
    std::string method;
    std::string scheme;
    std::string authority;
    std::string path;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct Http2Response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;
};

#ifdef HAVE_NGHTTP2

class PooledConnection;

// Client session over one pooled connection that negotiated "h2".
// The pool hands a connection to one caller at a time, so a session
// carries one stream at a time.
class Http2Session {
public:
    explicit Http2Session(PooledConnection& conn);
    ~Http2Session();

    Http2Session(const Http2Session&) = delete;
    Http2Session& operator=(const Http2Session&) = delete;

    // Sends the connection preface and SETTINGS. Throws TransportError.
    void start();

    // Throws TransportError (Protocol, ConnectionClosed, timeouts)
    Http2Response request(const Http2Request& req);

    // False once either side sent GOAWAY or the session failed
    bool is_alive() const;

private:
    struct Stream;

    static int on_header(nghttp2_session* session, const nghttp2_frame* frame,
                         const uint8_t* name, size_t namelen,
                         const uint8_t* value, size_t valuelen,
                         uint8_t flags, void* user_data);
    static int on_data_chunk(nghttp2_session* session, uint8_t flags, int32_t stream_id,
                             const uint8_t* data, size_t len, void* user_data);
    static int on_stream_close(nghttp2_session* session, int32_t stream_id,
                               uint32_t error_code, void* user_data);
    static ssize_t read_body(nghttp2_session* session, int32_t stream_id,
                             uint8_t* buf, size_t length, uint32_t* data_flags,
                             nghttp2_data_source* source, void* user_data);

    void flush();

    PooledConnection& conn_;
    nghttp2_session* session_ = nullptr;
    std::unique_ptr<Stream> stream_;
    bool failed_ = false;
};

#endif // HAVE_NGHTTP2

} // namespace tollgate
