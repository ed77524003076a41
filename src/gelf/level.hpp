/**
 * @file level.hpp
 * @brief Severity enumerations: syslog-compatible system levels and
 *        application message levels.
 *
 * SystemLevel values are the RFC 5424 severity codes and travel on the wire
 * as the GELF "level" field. MessageLevel is only used to filter records by a
 * level parsed out of free text.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace gelf_relay::gelf {

// ─────────────────────────────────────────────
// SystemLevel
// ─────────────────────────────────────────────

/// Lower value = more severe.
enum class SystemLevel : uint8_t {
    Emergency = 0,
    Alert = 1,
    Critical = 2,
    Error = 3,
    Warning = 4,
    Notice = 5,
    Informational = 6,
    Debug = 7
};

/**
 * @brief Map a syslog priority code to a level. Codes above 7 clamp to Debug.
 */
[[nodiscard]] constexpr SystemLevel system_level_from_code(uint64_t code) noexcept {
    return code > 7 ? SystemLevel::Debug : static_cast<SystemLevel>(code);
}

[[nodiscard]] constexpr uint8_t to_code(SystemLevel level) noexcept {
    return static_cast<uint8_t>(level);
}

[[nodiscard]] constexpr std::string_view to_string(SystemLevel level) noexcept {
    switch (level) {
        case SystemLevel::Emergency:     return "emergency";
        case SystemLevel::Alert:         return "alert";
        case SystemLevel::Critical:      return "critical";
        case SystemLevel::Error:         return "error";
        case SystemLevel::Warning:       return "warning";
        case SystemLevel::Notice:        return "notice";
        case SystemLevel::Informational: return "informational";
        case SystemLevel::Debug:         return "debug";
    }
    return "unknown";
}

/**
 * @brief Parse a configuration name. "info" is accepted for Informational.
 */
[[nodiscard]] std::optional<SystemLevel> parse_system_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────
// MessageLevel
// ─────────────────────────────────────────────

enum class MessageLevel : uint8_t {
    Fatal,
    Panic,
    Error,
    Warning,
    Info,
    Debug
};

[[nodiscard]] constexpr std::string_view to_string(MessageLevel level) noexcept {
    switch (level) {
        case MessageLevel::Fatal:   return "fatal";
        case MessageLevel::Panic:   return "panic";
        case MessageLevel::Error:   return "error";
        case MessageLevel::Warning: return "warning";
        case MessageLevel::Info:    return "info";
        case MessageLevel::Debug:   return "debug";
    }
    return "unknown";
}

/**
 * @brief Strict parse for configuration values; unknown names yield nullopt.
 */
[[nodiscard]] std::optional<MessageLevel> parse_message_level(std::string_view name) noexcept;

/**
 * @brief Lenient, case-insensitive mapping for words found in log text.
 *        Unknown words map to Debug.
 */
[[nodiscard]] MessageLevel message_level_from_word(std::string_view word);

}  // namespace gelf_relay::gelf
