#include "compression.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

#ifdef HAVE_ZLIB
#include <zlib.h>
#endif

#ifdef HAVE_BROTLI
#include <brotli/decode.h>
#include <brotli/encode.h>
#endif

namespace tollgate {

namespace {
constexpr size_t kChunkSize = 32768;
}

ContentEncoding Compression::parse_encoding(const std::string& content_encoding) {
    std::string lower = content_encoding;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    lower.erase(std::remove_if(lower.begin(), lower.end(),
                               [](unsigned char c) { return std::isspace(c) != 0; }), lower.end());

    if (lower.empty() || lower == "identity") return ContentEncoding::Identity;
    if (lower == "gzip" || lower == "x-gzip") return ContentEncoding::Gzip;
    if (lower == "deflate") return ContentEncoding::Deflate;
    if (lower == "br") return ContentEncoding::Brotli;
    return ContentEncoding::Unsupported;
}

std::string Compression::accept_encoding() {
    std::string encodings;

#ifdef HAVE_BROTLI
    encodings += "br";
#endif

#ifdef HAVE_ZLIB
    if (!encodings.empty()) encodings += ", ";
    encodings += "gzip, deflate";
#endif

    return encodings.empty() ? "identity" : encodings;
}

bool Compression::supported(ContentEncoding encoding) {
    switch (encoding) {
        case ContentEncoding::Identity:
            return true;
#ifdef HAVE_ZLIB
        case ContentEncoding::Gzip:
        case ContentEncoding::Deflate:
            return true;
#endif
#ifdef HAVE_BROTLI
        case ContentEncoding::Brotli:
            return true;
#endif
        default:
            return false;
    }
}

#ifdef HAVE_ZLIB

std::optional<std::string> Compression::inflate_with(const std::string& data, int window_bits) {
    z_stream stream{};
    if (inflateInit2(&stream, window_bits) != Z_OK) {
        return std::nullopt;
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::string output;
    output.reserve(data.size() * 3);
    std::vector<char> chunk(kChunkSize);

    int ret;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&stream);
            return std::nullopt;
        }

        output.append(chunk.data(), chunk.size() - stream.avail_out);

        // Truncated input: no progress possible
        if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            return std::nullopt;
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&stream);
    return output;
}

std::optional<std::string> Compression::deflate_with(const std::string& data, int window_bits, int level) {
    z_stream stream{};
    if (deflateInit2(&stream, level, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::string output;
    output.reserve(deflateBound(&stream, static_cast<uLong>(data.size())));
    std::vector<char> chunk(kChunkSize);

    int ret;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());

        ret = deflate(&stream, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
            deflateEnd(&stream);
            return std::nullopt;
        }

        output.append(chunk.data(), chunk.size() - stream.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&stream);
    return output;
}

#endif // HAVE_ZLIB

#ifdef HAVE_BROTLI

std::optional<std::string> Compression::brotli_decode(const std::string& data) {
    BrotliDecoderState* state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
    if (!state) {
        return std::nullopt;
    }

    size_t available_in = data.size();
    const uint8_t* next_in = reinterpret_cast<const uint8_t*>(data.data());

    std::string output;
    std::vector<uint8_t> chunk(kChunkSize);

    BrotliDecoderResult result;
    do {
        size_t available_out = chunk.size();
        uint8_t* next_out = chunk.data();

        result = BrotliDecoderDecompressStream(state, &available_in, &next_in,
                                               &available_out, &next_out, nullptr);

        output.append(reinterpret_cast<const char*>(chunk.data()), chunk.size() - available_out);
    } while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT);

    BrotliDecoderDestroyInstance(state);

    if (result != BROTLI_DECODER_RESULT_SUCCESS) {
        return std::nullopt;
    }
    return output;
}

std::optional<std::string> Compression::brotli_encode(const std::string& data, int level) {
    size_t output_size = BrotliEncoderMaxCompressedSize(data.size());
    if (output_size == 0) {
        output_size = data.size() + 1024;
    }
    std::string output(output_size, '\0');

    BROTLI_BOOL ok = BrotliEncoderCompress(
        level,
        BROTLI_DEFAULT_WINDOW,
        BROTLI_DEFAULT_MODE,
        data.size(), reinterpret_cast<const uint8_t*>(data.data()),
        &output_size, reinterpret_cast<uint8_t*>(&output[0]));

    if (ok != BROTLI_TRUE) {
        return std::nullopt;
    }

    output.resize(output_size);
    return output;
}

#endif // HAVE_BROTLI

std::optional<std::string> Compression::decode(const std::string& data, ContentEncoding encoding) {
    if (data.empty()) {
        return std::string();
    }

    switch (encoding) {
        case ContentEncoding::Identity:
            return data;
#ifdef HAVE_ZLIB
        case ContentEncoding::Gzip:
            // 32: detect gzip or zlib header
            return inflate_with(data, 15 + 32);
        case ContentEncoding::Deflate: {
            // Servers disagree on zlib-wrapped vs raw deflate
            auto wrapped = inflate_with(data, 15);
            return wrapped ? wrapped : inflate_with(data, -15);
        }
#endif
#ifdef HAVE_BROTLI
        case ContentEncoding::Brotli:
            return brotli_decode(data);
#endif
        default:
            return std::nullopt;
    }
}

std::optional<std::string> Compression::encode(const std::string& data,
                                               ContentEncoding encoding,
                                               int level) {
    switch (encoding) {
        case ContentEncoding::Identity:
            return data;
#ifdef HAVE_ZLIB
        case ContentEncoding::Gzip:
            return deflate_with(data, 15 + 16, level);
        case ContentEncoding::Deflate:
            return deflate_with(data, 15, level);
#endif
#ifdef HAVE_BROTLI
        case ContentEncoding::Brotli:
            return brotli_encode(data, level);
#endif
        default:
            (void)level;
            return std::nullopt;
    }
}

} // namespace tollgate
