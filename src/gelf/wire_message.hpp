/**
 * @file wire_message.hpp
 * @brief GELF 1.1 envelope: a Message plus team/service context.
 *
 * The only place that knows the on-wire field layout:
 *
 *   version        "1.1"
 *   host           trimmed of wrapping quotes/spaces
 *   short_message  trimmed of wrapping quotes/spaces
 *   level          syslog code 0..7
 *   full_message   only if set
 *   timestamp      seconds since epoch; "now" at encode time if unset
 *   team, service  only if configured
 *   _<key>         one per metadata entry
 */

#pragma once

#include "core/result.hpp"
#include "gelf/message.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace gelf_relay::gelf {

inline constexpr std::string_view GELF_VERSION = "1.1";

class WireMessage {
public:
    WireMessage(Message message,
                std::optional<std::string> team = std::nullopt,
                std::optional<std::string> service = std::nullopt);

    [[nodiscard]] const Message& message() const noexcept { return message_; }
    [[nodiscard]] const std::optional<std::string>& team() const noexcept { return team_; }
    [[nodiscard]] const std::optional<std::string>& service() const noexcept { return service_; }

    /// Build the GELF JSON object. Timestamp is filled from the wall clock if unset.
    [[nodiscard]] nlohmann::json to_json() const;

    /// Serialize to a compact GELF/JSON string.
    [[nodiscard]] Result<std::string> to_gelf() const;

private:
    Message message_;
    std::optional<std::string> team_;
    std::optional<std::string> service_;
};

/// Current wall-clock time as fractional seconds since the epoch.
[[nodiscard]] double current_time_unix() noexcept;

/// Strip leading and trailing '"' and ' ' characters.
[[nodiscard]] std::string_view trim_wrapping(std::string_view text) noexcept;

}  // namespace gelf_relay::gelf
