/**
 * @file test_compression.cpp
 * @brief Unit tests for the none/gzip/zlib payload codec.
 */

#include "gelf/compression.hpp"
#include "gelf/message.hpp"
#include "gelf/wire_message.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zlib.h>

#include <string>
#include <vector>

using namespace gelf_relay;
using namespace gelf_relay::gelf;

namespace {

/// Inflate a zlib or gzip stream (windowBits 15 + 32 detects the header).
std::string inflate_all(const std::vector<uint8_t>& data) {
    z_stream stream{};
    if (inflateInit2(&stream, 15 + 32) != Z_OK) return {};

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char buffer[4096];
    int rc = Z_OK;
    while (rc == Z_OK) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = sizeof(buffer);
        rc = inflate(&stream, Z_NO_FLUSH);
        out.append(buffer, sizeof(buffer) - stream.avail_out);
    }
    inflateEnd(&stream);
    return rc == Z_STREAM_END ? out : std::string{};
}

std::string as_string(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace

TEST(CompressionTest, ParseNames) {
    EXPECT_EQ(parse_compression("none"), Compression::None);
    EXPECT_EQ(parse_compression("gzip"), Compression::Gzip);
    EXPECT_EQ(parse_compression("zlib"), Compression::Zlib);
    EXPECT_FALSE(parse_compression("lz4").has_value());
    EXPECT_EQ(DEFAULT_COMPRESSION, Compression::Gzip);
}

TEST(CompressionTest, NonePassesBytesThrough) {
    auto out = compress_bytes(Compression::None, "plain text");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(as_string(*out), "plain text");
}

TEST(CompressionTest, GzipProducesGzipMember) {
    std::string input(2000, 'x');
    auto out = compress_bytes(Compression::Gzip, input);
    ASSERT_TRUE(out.has_value()) << out.error().message;
    ASSERT_GE(out->size(), 2u);
    EXPECT_EQ((*out)[0], 0x1f);
    EXPECT_EQ((*out)[1], 0x8b);
    EXPECT_LT(out->size(), input.size());
    EXPECT_EQ(inflate_all(*out), input);
}

TEST(CompressionTest, ZlibProducesZlibStream) {
    std::string input = R"({"version":"1.1","host":"h1","short_message":"hello"})";
    auto out = compress_bytes(Compression::Zlib, input);
    ASSERT_TRUE(out.has_value()) << out.error().message;
    ASSERT_GE(out->size(), 2u);
    EXPECT_EQ((*out)[0], 0x78);
    EXPECT_EQ(((*out)[0] * 256 + (*out)[1]) % 31, 0);
    EXPECT_EQ(inflate_all(*out), input);
}

TEST(CompressionTest, EmptyInputRoundTrips) {
    for (auto algorithm : {Compression::Gzip, Compression::Zlib}) {
        auto out = compress_bytes(algorithm, "");
        ASSERT_TRUE(out.has_value());
        EXPECT_FALSE(out->empty());
        EXPECT_EQ(inflate_all(*out), "");
    }
}

TEST(CompressionTest, CompressMessageEncodesGelf) {
    Message msg("h1", "disk full");
    msg.set_level(SystemLevel::Error);
    WireMessage wire(std::move(msg));

    auto out = compress(Compression::Gzip, wire);
    ASSERT_TRUE(out.has_value());

    auto doc = nlohmann::json::parse(inflate_all(*out));
    EXPECT_EQ(doc["short_message"], "disk full");
    EXPECT_EQ(doc["level"], 3);
}

TEST(CompressionTest, EncodingErrorPropagates) {
    WireMessage wire(Message("h1", std::string{"\xc3\x28"}));
    auto out = compress(Compression::Zlib, wire);
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().kind, ErrorKind::ParsingFailure);
}
