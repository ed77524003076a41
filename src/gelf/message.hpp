/**
 * @file message.hpp
 * @brief Mutable GELF message builder for one log event.
 */

#pragma once

#include "gelf/level.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace gelf_relay::gelf {

using Metadata = std::unordered_map<std::string, nlohmann::json>;

/**
 * @brief One in-flight log event.
 *
 * Fields left unset keep their GELF defaults: no full message, no timestamp
 * (the encoder stamps the current time) and level Alert. Owned by a single
 * record's processing; not shared across threads.
 */
class Message {
public:
    /// Metadata key reserved by the GELF protocol.
    static constexpr std::string_view RESERVED_KEY = "id";

    Message(std::string host, std::string short_message);

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    Message& set_host(std::string host);

    [[nodiscard]] const std::string& short_message() const noexcept { return short_message_; }
    Message& set_short_message(std::string message);

    [[nodiscard]] const std::optional<std::string>& full_message() const noexcept {
        return full_message_;
    }
    Message& set_full_message(std::string message);
    Message& clear_full_message() noexcept;

    [[nodiscard]] std::optional<double> timestamp() const noexcept { return timestamp_; }
    Message& set_timestamp(double seconds) noexcept;
    Message& clear_timestamp() noexcept;

    [[nodiscard]] SystemLevel level() const noexcept { return level_; }
    Message& set_level(SystemLevel level) noexcept;

    /**
     * @brief Insert or replace a metadata field.
     * @return false (and no change) when key is the reserved "id".
     */
    [[nodiscard]] bool set_metadata(std::string key, nlohmann::json value);

    [[nodiscard]] const nlohmann::json* metadata(const std::string& key) const;
    [[nodiscard]] const Metadata& all_metadata() const noexcept { return metadata_; }

private:
    std::string host_;
    std::string short_message_;
    std::optional<std::string> full_message_;
    std::optional<double> timestamp_;
    SystemLevel level_ = SystemLevel::Alert;
    Metadata metadata_;
};

}  // namespace gelf_relay::gelf
