/**
 * @file config.hpp
 * @brief Relay configuration with TOML deserialization.
 *
 * The document has three parts:
 *   - top-level keys: the watched settings, hot-reloaded at runtime;
 *   - [global]:       fixed for the process lifetime;
 *   - [logging]:      read once at startup.
 */

#pragma once

#include "core/result.hpp"
#include "gelf/compression.hpp"
#include "gelf/level.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gelf_relay {

enum class LogSource : uint8_t {
    Stdin,
    Journal
};

[[nodiscard]] constexpr std::string_view to_string(LogSource source) noexcept {
    switch (source) {
        case LogSource::Stdin:   return "stdin";
        case LogSource::Journal: return "journal";
    }
    return "unknown";
}

[[nodiscard]] std::optional<LogSource> parse_log_source(std::string_view name) noexcept;

struct GlobalConfig {
    LogSource log_source = LogSource::Stdin;
    uint16_t sender_port = 0;                   ///< 0 = ephemeral

    bool operator==(const GlobalConfig&) const = default;
};

/// Upper bound for team and service names, in bytes.
inline constexpr size_t MAX_NAME_LENGTH = 2048;

/**
 * @brief Settings that may change while the ingestion loop runs.
 */
struct WatchedConfig {
    std::string graylog_addr = "localhost:12201";
    gelf::Compression compression = gelf::DEFAULT_COMPRESSION;
    std::optional<std::string> team;
    std::optional<std::string> service;
    gelf::SystemLevel log_level_system = gelf::SystemLevel::Informational;
    std::optional<gelf::MessageLevel> log_level_message;

    bool operator==(const WatchedConfig&) const = default;
};

struct LoggingConfig {
    std::string level = "info";
    std::optional<std::filesystem::path> file;  ///< stderr when unset
};

/**
 * @brief Top-level relay configuration.
 */
struct Config {
    GlobalConfig global;
    WatchedConfig watched;
    LoggingConfig logging;
};

/**
 * @brief Load and validate configuration from a TOML file.
 *
 * graylog_addr is required. Unknown enum names, wrong value types and an
 * out-of-range sender_port are ParsingFailure; a missing file is IoFailure.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from an in-memory TOML document.
 */
Result<Config> parse_config(std::string_view document);

/**
 * @brief Check a "host:port" target address (numeric port 1..65535).
 */
[[nodiscard]] bool is_valid_address(std::string_view address) noexcept;

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace gelf_relay
