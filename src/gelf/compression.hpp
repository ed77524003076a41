/**
 * @file compression.hpp
 * @brief GELF payload compression: none, gzip or zlib (via zlib's deflate).
 */

#pragma once

#include "core/result.hpp"
#include "gelf/wire_message.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace gelf_relay::gelf {

enum class Compression : uint8_t {
    None,
    Gzip,
    Zlib
};

/// Used when the configuration does not name an algorithm.
inline constexpr Compression DEFAULT_COMPRESSION = Compression::Gzip;

[[nodiscard]] constexpr std::string_view to_string(Compression algorithm) noexcept {
    switch (algorithm) {
        case Compression::None: return "none";
        case Compression::Gzip: return "gzip";
        case Compression::Zlib: return "zlib";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Compression> parse_compression(std::string_view name) noexcept;

/**
 * @brief Serialize a message to GELF/JSON and compress it.
 */
[[nodiscard]] Result<std::vector<uint8_t>> compress(Compression algorithm,
                                                    const WireMessage& message);

/**
 * @brief Compress raw bytes with default deflate settings.
 */
[[nodiscard]] Result<std::vector<uint8_t>> compress_bytes(Compression algorithm,
                                                          std::string_view data);

}  // namespace gelf_relay::gelf
