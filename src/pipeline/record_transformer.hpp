/**
 * @file record_transformer.hpp
 * @brief Maps one journald-style JSON record to a compressed GELF payload.
 *
 * Pure computation: parse, filter by level, build the GELF message, encode
 * and compress. Sending happens in the ingestion loop.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "gelf/level.hpp"
#include "gelf/wire_message.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace gelf_relay {

/// Fields consumed by the transformer itself or too noisy to forward.
inline constexpr std::array<std::string_view, 9> IGNORED_FIELDS = {
    "MESSAGE",
    "_HOSTNAME",
    "__REALTIME_TIMESTAMP",
    "PRIORITY",
    "__CURSOR",
    "_BOOT_ID",
    "_MACHINE_ID",
    "_SYSTEMD_CGROUP",
    "_SYSTEMD_SLICE",
};

inline constexpr std::string_view UNDEFINED_HOST = "undefined";

[[nodiscard]] bool is_metadata_field(std::string_view field) noexcept;

/**
 * @brief Find "level=<word> " in free text (case-insensitive, first match).
 * @return the mapped level, Debug for unknown words, nullopt without a match.
 */
[[nodiscard]] std::optional<gelf::MessageLevel> extract_message_level(std::string_view text);

/**
 * @brief Build the GELF envelope for a decoded record.
 *
 * Errors: NoMessage without MESSAGE, InsufficientLogLevel when a threshold
 * rejects the record.
 */
[[nodiscard]] Result<gelf::WireMessage> build_message(const nlohmann::json& record,
                                                      const WatchedConfig& config);

/**
 * @brief Parse, filter, encode and compress one raw line.
 *
 * Errors: ParsingFailure for malformed JSON or a non-object record, plus
 * everything build_message and the codec report.
 */
[[nodiscard]] Result<std::vector<uint8_t>> transform_record(std::string_view line,
                                                            const WatchedConfig& config);

}  // namespace gelf_relay
