#include "http2_session.hpp"
#include "connection_pool.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace tollgate {

struct Http2Session::Stream {
    int32_t id = -1;
    Http2Response response;
    const std::string* body = nullptr;
    size_t body_offset = 0;
    bool closed = false;
    uint32_t error_code = NGHTTP2_NO_ERROR;
};

namespace {

// Connection-specific headers are not allowed in HTTP/2
bool is_hop_by_hop(const std::string& name) {
    return name == "connection" || name == "keep-alive" || name == "proxy-connection" ||
           name == "transfer-encoding" || name == "upgrade" || name == "host" ||
           name == "te";
}

nghttp2_nv make_nv(const std::string& name, const std::string& value) {
    nghttp2_nv nv;
    nv.name = reinterpret_cast<uint8_t*>(const_cast<char*>(name.data()));
    nv.namelen = name.size();
    nv.value = reinterpret_cast<uint8_t*>(const_cast<char*>(value.data()));
    nv.valuelen = value.size();
    nv.flags = NGHTTP2_NV_FLAG_NONE;
    return nv;
}

} // namespace

Http2Session::Http2Session(PooledConnection& conn)
    : conn_(conn), stream_(std::make_unique<Stream>()) {
}

Http2Session::~Http2Session() {
    if (session_) {
        nghttp2_session_del(session_);
    }
}

int Http2Session::on_header(nghttp2_session*, const nghttp2_frame* frame,
                            const uint8_t* name, size_t namelen,
                            const uint8_t* value, size_t valuelen,
                            uint8_t, void* user_data) {
    auto* self = static_cast<Http2Session*>(user_data);
    if (frame->hd.type != NGHTTP2_HEADERS || frame->hd.stream_id != self->stream_->id) {
        return 0;
    }

    std::string key(reinterpret_cast<const char*>(name), namelen);
    std::string val(reinterpret_cast<const char*>(value), valuelen);

    if (key == ":status") {
        int status = std::atoi(val.c_str());
        // Interim 1xx responses are followed by the final one
        self->stream_->response.status_code = status;
        return 0;
    }
    if (!key.empty() && key[0] == ':') {
        return 0;
    }

    auto& headers = self->stream_->response.headers;
    auto it = headers.find(key);
    if (it == headers.end()) {
        headers.emplace(std::move(key), std::move(val));
    } else {
        it->second += ", " + val;
    }
    return 0;
}

int Http2Session::on_data_chunk(nghttp2_session*, uint8_t, int32_t stream_id,
                                const uint8_t* data, size_t len, void* user_data) {
    auto* self = static_cast<Http2Session*>(user_data);
    if (stream_id == self->stream_->id) {
        self->stream_->response.body.append(reinterpret_cast<const char*>(data), len);
    }
    return 0;
}

int Http2Session::on_stream_close(nghttp2_session*, int32_t stream_id,
                                  uint32_t error_code, void* user_data) {
    auto* self = static_cast<Http2Session*>(user_data);
    if (stream_id == self->stream_->id) {
        self->stream_->closed = true;
        self->stream_->error_code = error_code;
    }
    return 0;
}

ssize_t Http2Session::read_body(nghttp2_session*, int32_t, uint8_t* buf, size_t length,
                                uint32_t* data_flags, nghttp2_data_source* source, void*) {
    auto* stream = static_cast<Stream*>(source->ptr);
    size_t remaining = stream->body->size() - stream->body_offset;
    size_t n = std::min(length, remaining);

    std::memcpy(buf, stream->body->data() + stream->body_offset, n);
    stream->body_offset += n;

    if (stream->body_offset == stream->body->size()) {
        *data_flags |= NGHTTP2_DATA_FLAG_EOF;
    }
    return static_cast<ssize_t>(n);
}

void Http2Session::flush() {
    while (true) {
        const uint8_t* data = nullptr;
        ssize_t n = nghttp2_session_mem_send(session_, &data);
        if (n < 0) {
            failed_ = true;
            throw TransportError(TransportErrorKind::Protocol,
                                 nghttp2_strerror(static_cast<int>(n)));
        }
        if (n == 0) {
            return;
        }
        conn_.send_all(reinterpret_cast<const char*>(data), static_cast<size_t>(n));
    }
}

void Http2Session::start() {
    nghttp2_session_callbacks* callbacks = nullptr;
    if (nghttp2_session_callbacks_new(&callbacks) != 0) {
        throw TransportError(TransportErrorKind::Protocol, "nghttp2 callbacks allocation failed");
    }

    nghttp2_session_callbacks_set_on_header_callback(callbacks, on_header);
    nghttp2_session_callbacks_set_on_data_chunk_recv_callback(callbacks, on_data_chunk);
    nghttp2_session_callbacks_set_on_stream_close_callback(callbacks, on_stream_close);

    int rv = nghttp2_session_client_new(&session_, callbacks, this);
    nghttp2_session_callbacks_del(callbacks);

    if (rv != 0) {
        session_ = nullptr;
        throw TransportError(TransportErrorKind::Protocol, nghttp2_strerror(rv));
    }

    nghttp2_settings_entry iv[] = {
        {NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, 100},
        {NGHTTP2_SETTINGS_ENABLE_PUSH, 0},
    };
    rv = nghttp2_submit_settings(session_, NGHTTP2_FLAG_NONE, iv, sizeof(iv) / sizeof(iv[0]));
    if (rv != 0) {
        failed_ = true;
        throw TransportError(TransportErrorKind::Protocol, nghttp2_strerror(rv));
    }

    // Preface and SETTINGS
    flush();
}

Http2Response Http2Session::request(const Http2Request& req) {
    if (!is_alive()) {
        throw TransportError(TransportErrorKind::ConnectionClosed, "HTTP/2 session is gone");
    }

    *stream_ = Stream();
    stream_->body = &req.body;

    // nghttp2 copies name/value pairs at submit, these only need to live until then
    std::vector<std::pair<std::string, std::string>> fields;
    fields.reserve(req.headers.size() + 4);
    fields.emplace_back(":method", req.method);
    fields.emplace_back(":scheme", req.scheme);
    fields.emplace_back(":authority", req.authority);
    fields.emplace_back(":path", req.path.empty() ? "/" : req.path);

    for (const auto& header : req.headers) {
        std::string name = header.first;
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (is_hop_by_hop(name)) continue;
        fields.emplace_back(std::move(name), header.second);
    }

    std::vector<nghttp2_nv> nva;
    nva.reserve(fields.size());
    for (const auto& field : fields) {
        nva.push_back(make_nv(field.first, field.second));
    }

    nghttp2_data_provider provider;
    provider.source.ptr = stream_.get();
    provider.read_callback = read_body;

    int32_t stream_id = nghttp2_submit_request(session_, nullptr, nva.data(), nva.size(),
                                               req.body.empty() ? nullptr : &provider,
                                               nullptr);
    if (stream_id < 0) {
        failed_ = true;
        throw TransportError(TransportErrorKind::Protocol, nghttp2_strerror(stream_id));
    }
    stream_->id = stream_id;

    char buf[16384];
    try {
        flush();
        while (!stream_->closed) {
            if (!nghttp2_session_want_read(session_) && !nghttp2_session_want_write(session_)) {
                break;
            }

            size_t n = conn_.recv_some(buf, sizeof(buf));
            if (n == 0) {
                failed_ = true;
                throw TransportError(TransportErrorKind::ConnectionClosed,
                                     "peer closed the HTTP/2 connection");
            }

            ssize_t consumed = nghttp2_session_mem_recv(session_,
                                                        reinterpret_cast<const uint8_t*>(buf), n);
            if (consumed < 0) {
                failed_ = true;
                throw TransportError(TransportErrorKind::Protocol,
                                     nghttp2_strerror(static_cast<int>(consumed)));
            }

            // WINDOW_UPDATE, SETTINGS ack, PING replies
            flush();
        }
    } catch (const TransportError&) {
        failed_ = true;
        throw;
    }

    if (!stream_->closed) {
        failed_ = true;
        throw TransportError(TransportErrorKind::ConnectionClosed,
                             "HTTP/2 stream " + std::to_string(stream_id) + " did not complete");
    }
    if (stream_->error_code != NGHTTP2_NO_ERROR) {
        throw TransportError(TransportErrorKind::Protocol,
                             std::string("stream reset: ") +
                             nghttp2_http2_strerror(stream_->error_code));
    }

    logging::debug("h2 stream ", stream_id, " -> ", stream_->response.status_code,
                   " (", stream_->response.body.size(), " bytes)");

    Http2Response response = std::move(stream_->response);
    *stream_ = Stream();
    return response;
}

bool Http2Session::is_alive() const {
    if (!session_ || failed_) {
        return false;
    }
    return nghttp2_session_want_read(session_) || nghttp2_session_want_write(session_);
}

} // namespace tollgate
