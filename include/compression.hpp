#pragma once

#include <optional>
#include <string>

namespace tollgate {

enum class ContentEncoding {
    Identity,
    Gzip,
    Deflate,
    Brotli,
    Unsupported
};

class Compression {
public:
    // Maps a Content-Encoding header value to a codec
    static ContentEncoding parse_encoding(const std::string& content_encoding);

    // Accept-Encoding value listing the codecs compiled in
    static std::string accept_encoding();

    static bool supported(ContentEncoding encoding);

    // std::nullopt when the codec is missing or the data is corrupt
    static std::optional<std::string> decode(const std::string& data, ContentEncoding encoding);

    static std::optional<std::string> encode(const std::string& data,
                                             ContentEncoding encoding,
                                             int level = 6);

private:
#ifdef HAVE_ZLIB
    static std::optional<std::string> inflate_with(const std::string& data, int window_bits);
    static std::optional<std::string> deflate_with(const std::string& data, int window_bits, int level);
#endif

#ifdef HAVE_BROTLI
    static std::optional<std::string> brotli_decode(const std::string& data);
    static std::optional<std::string> brotli_encode(const std::string& data, int level);
#endif
};

} // namespace tollgate
