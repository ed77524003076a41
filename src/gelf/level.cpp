/**
 * @file level.cpp
 * @brief Level name parsing.
 */

#include "gelf/level.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace gelf_relay::gelf {

std::optional<SystemLevel> parse_system_level(std::string_view name) noexcept {
    if (name == "emergency") return SystemLevel::Emergency;
    if (name == "alert") return SystemLevel::Alert;
    if (name == "critical") return SystemLevel::Critical;
    if (name == "error") return SystemLevel::Error;
    if (name == "warning") return SystemLevel::Warning;
    if (name == "notice") return SystemLevel::Notice;
    if (name == "informational" || name == "info") return SystemLevel::Informational;
    if (name == "debug") return SystemLevel::Debug;
    return std::nullopt;
}

std::optional<MessageLevel> parse_message_level(std::string_view name) noexcept {
    if (name == "fatal") return MessageLevel::Fatal;
    if (name == "panic") return MessageLevel::Panic;
    if (name == "error") return MessageLevel::Error;
    if (name == "warning") return MessageLevel::Warning;
    if (name == "info") return MessageLevel::Info;
    if (name == "debug") return MessageLevel::Debug;
    return std::nullopt;
}

MessageLevel message_level_from_word(std::string_view word) {
    std::string lowered(word);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return parse_message_level(lowered).value_or(MessageLevel::Debug);
}

}  // namespace gelf_relay::gelf
