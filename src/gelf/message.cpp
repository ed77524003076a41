/**
 * @file message.cpp
 * @brief Message setters.
 */

#include "gelf/message.hpp"

#include <utility>

namespace gelf_relay::gelf {

Message::Message(std::string host, std::string short_message)
    : host_(std::move(host)), short_message_(std::move(short_message)) {}

Message& Message::set_host(std::string host) {
    host_ = std::move(host);
    return *this;
}

Message& Message::set_short_message(std::string message) {
    short_message_ = std::move(message);
    return *this;
}

Message& Message::set_full_message(std::string message) {
    full_message_ = std::move(message);
    return *this;
}

Message& Message::clear_full_message() noexcept {
    full_message_.reset();
    return *this;
}

Message& Message::set_timestamp(double seconds) noexcept {
    timestamp_ = seconds;
    return *this;
}

Message& Message::clear_timestamp() noexcept {
    timestamp_.reset();
    return *this;
}

Message& Message::set_level(SystemLevel level) noexcept {
    level_ = level;
    return *this;
}

bool Message::set_metadata(std::string key, nlohmann::json value) {
    if (key == RESERVED_KEY) return false;
    metadata_.insert_or_assign(std::move(key), std::move(value));
    return true;
}

const nlohmann::json* Message::metadata(const std::string& key) const {
    auto it = metadata_.find(key);
    return it == metadata_.end() ? nullptr : &it->second;
}

}  // namespace gelf_relay::gelf
