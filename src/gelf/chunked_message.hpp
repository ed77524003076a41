/**
 * @file chunked_message.hpp
 * @brief GELF UDP chunking.
 *
 * Payloads larger than one datagram body are split into chunks, each
 * prefixed with the 12-byte GELF chunk header:
 *
 *   [0x1e 0x0f][8-byte message id][1-byte sequence][1-byte total][body]
 *
 * A payload that fits in one body is sent as-is, without a header; GELF
 * receivers only reassemble datagrams that start with the chunk magic.
 * At most 128 chunks per message.
 */

#pragma once

#include "core/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace gelf_relay::gelf {

/// Maximum datagram size, header included.
enum class ChunkSize : uint16_t {
    Wan = 1420,
    Lan = 8154
};

[[nodiscard]] constexpr size_t datagram_size(ChunkSize size) noexcept {
    return static_cast<size_t>(size);
}

class ChunkedMessage {
public:
    static constexpr uint8_t MAGIC[2] = {0x1e, 0x0f};
    static constexpr size_t HEADER_SIZE = 12;
    static constexpr size_t MAX_CHUNKS = 128;

    using MessageId = std::array<uint8_t, 8>;
    using Datagram = std::vector<uint8_t>;
    using const_iterator = std::vector<Datagram>::const_iterator;

    /**
     * @brief Split a payload into datagrams.
     *
     * Fails with InternalFailure when more than MAX_CHUNKS would be needed;
     * nothing is produced in that case.
     */
    [[nodiscard]] static Result<ChunkedMessage> create(ChunkSize size,
                                                       std::vector<uint8_t> payload);

    /// Payload bytes carried per chunk for the given class.
    [[nodiscard]] static constexpr size_t body_size(ChunkSize size) noexcept {
        return datagram_size(size) - HEADER_SIZE;
    }

    [[nodiscard]] const MessageId& id() const noexcept { return id_; }
    [[nodiscard]] size_t chunk_count() const noexcept { return datagrams_.size(); }
    [[nodiscard]] bool is_chunked() const noexcept { return datagrams_.size() > 1; }
    [[nodiscard]] const std::vector<Datagram>& datagrams() const noexcept { return datagrams_; }

    [[nodiscard]] const_iterator begin() const noexcept { return datagrams_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return datagrams_.end(); }

private:
    ChunkedMessage(MessageId id, std::vector<Datagram> datagrams);

    MessageId id_;
    std::vector<Datagram> datagrams_;
};

/// Eight random bytes from a per-thread generator seeded from std::random_device.
[[nodiscard]] ChunkedMessage::MessageId generate_message_id();

}  // namespace gelf_relay::gelf
