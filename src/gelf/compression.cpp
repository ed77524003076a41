/**
 * @file compression.cpp
 * @brief zlib-backed compression.
 *
 * Both wrappers use deflate with the default level; only windowBits differ:
 * 15 produces a zlib stream, 15 + 16 a gzip member.
 */

#include "gelf/compression.hpp"

#include <string>

#include <zlib.h>

namespace gelf_relay::gelf {

namespace {

constexpr int ZLIB_WINDOW_BITS = 15;
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr int DEFAULT_MEM_LEVEL = 8;

Error zlib_error(const char* step, int code, const z_stream& stream) {
    std::string detail = stream.msg != nullptr ? stream.msg : ::zError(code);
    return Error{ErrorKind::CompressionFailure,
                 std::string{step} + " failed: " + detail};
}

Result<std::vector<uint8_t>> deflate_all(std::string_view data, int window_bits) {
    z_stream stream{};
    int rc = ::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                            window_bits, DEFAULT_MEM_LEVEL, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        return zlib_error("deflateInit2", rc, stream);
    }

    std::vector<uint8_t> out(::deflateBound(&stream, static_cast<uLong>(data.size())));

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    rc = ::deflate(&stream, Z_FINISH);
    if (rc != Z_STREAM_END) {
        auto err = zlib_error("deflate", rc, stream);
        ::deflateEnd(&stream);
        return err;
    }

    out.resize(stream.total_out);
    ::deflateEnd(&stream);
    return out;
}

}  // anonymous namespace

std::optional<Compression> parse_compression(std::string_view name) noexcept {
    if (name == "none") return Compression::None;
    if (name == "gzip") return Compression::Gzip;
    if (name == "zlib") return Compression::Zlib;
    return std::nullopt;
}

Result<std::vector<uint8_t>> compress_bytes(Compression algorithm, std::string_view data) {
    switch (algorithm) {
        case Compression::None:
            return std::vector<uint8_t>(data.begin(), data.end());
        case Compression::Gzip:
            return deflate_all(data, GZIP_WINDOW_BITS);
        case Compression::Zlib:
            return deflate_all(data, ZLIB_WINDOW_BITS);
    }
    return Error{ErrorKind::CompressionFailure, "unknown compression algorithm"};
}

Result<std::vector<uint8_t>> compress(Compression algorithm, const WireMessage& message) {
    auto json = message.to_gelf();
    if (!json) return json.error();
    return compress_bytes(algorithm, *json);
}

}  // namespace gelf_relay::gelf
