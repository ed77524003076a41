/**
 * @file chunked_message.cpp
 * @brief GELF chunk header construction.
 */

#include "gelf/chunked_message.hpp"

#include <algorithm>
#include <random>
#include <string>

namespace gelf_relay::gelf {

ChunkedMessage::MessageId generate_message_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t value = rng();

    ChunkedMessage::MessageId id{};
    for (size_t i = 0; i < id.size(); ++i) {
        id[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
    return id;
}

ChunkedMessage::ChunkedMessage(MessageId id, std::vector<Datagram> datagrams)
    : id_(id), datagrams_(std::move(datagrams)) {}

Result<ChunkedMessage> ChunkedMessage::create(ChunkSize size, std::vector<uint8_t> payload) {
    const size_t body = body_size(size);
    const size_t total = payload.empty() ? 1 : (payload.size() + body - 1) / body;

    if (total > MAX_CHUNKS) {
        return Error{ErrorKind::InternalFailure,
                     "failed to split message on " + std::to_string(datagram_size(size))
                     + "-byte chunks: " + std::to_string(payload.size())
                     + " bytes need " + std::to_string(total) + " chunks"};
    }

    auto id = generate_message_id();
    std::vector<Datagram> datagrams;
    datagrams.reserve(total);

    if (total == 1) {
        datagrams.push_back(std::move(payload));
        return ChunkedMessage{id, std::move(datagrams)};
    }

    for (size_t seq = 0; seq < total; ++seq) {
        const size_t offset = seq * body;
        const size_t length = std::min(body, payload.size() - offset);

        Datagram datagram;
        datagram.reserve(HEADER_SIZE + length);
        datagram.push_back(MAGIC[0]);
        datagram.push_back(MAGIC[1]);
        datagram.insert(datagram.end(), id.begin(), id.end());
        datagram.push_back(static_cast<uint8_t>(seq));
        datagram.push_back(static_cast<uint8_t>(total));
        datagram.insert(datagram.end(),
                        payload.begin() + static_cast<std::ptrdiff_t>(offset),
                        payload.begin() + static_cast<std::ptrdiff_t>(offset + length));
        datagrams.push_back(std::move(datagram));
    }

    return ChunkedMessage{id, std::move(datagrams)};
}

}  // namespace gelf_relay::gelf
