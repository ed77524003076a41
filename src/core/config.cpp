/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

#include <toml++/toml.hpp>

namespace gelf_relay {

namespace {

Error type_error(std::string_view key, std::string_view expected) {
    return Error{ErrorKind::ParsingFailure,
                 std::string{key} + ": expected " + std::string{expected}};
}

/**
 * @brief Optional string value; present-but-not-a-string is an error.
 */
Result<std::optional<std::string>> string_field(const toml::table& tbl, std::string_view key) {
    const toml::node* node = tbl.get(key);
    if (node == nullptr) return std::optional<std::string>{};
    if (const auto* str = node->as_string()) return std::optional<std::string>{str->get()};
    return type_error(key, "a string");
}

Result<std::optional<int64_t>> integer_field(const toml::table& tbl, std::string_view key) {
    const toml::node* node = tbl.get(key);
    if (node == nullptr) return std::optional<int64_t>{};
    if (const auto* num = node->as_integer()) return std::optional<int64_t>{num->get()};
    return type_error(key, "an integer");
}

/**
 * @brief Optional team/service name, bounded because it is copied into every message.
 */
Result<std::optional<std::string>> name_field(const toml::table& tbl, std::string_view key) {
    auto name = string_field(tbl, key);
    if (!name) return name.error();
    if (*name && (*name)->size() > MAX_NAME_LENGTH) {
        return Error{ErrorKind::ParsingFailure,
                     std::string{key} + ": longer than " + std::to_string(MAX_NAME_LENGTH)
                     + " bytes"};
    }
    return name;
}

Error unknown_value(std::string_view key, std::string_view value) {
    return Error{ErrorKind::ParsingFailure,
                 std::string{key} + ": unknown value \"" + std::string{value} + "\""};
}

Result<void> read_watched(const toml::table& tbl, WatchedConfig& watched) {
    auto addr = string_field(tbl, "graylog_addr");
    if (!addr) return addr.error();
    if (!*addr) {
        return Error{ErrorKind::ParsingFailure, "graylog_addr: missing required key"};
    }
    if (!is_valid_address(**addr)) {
        return Error{ErrorKind::ParsingFailure,
                     "graylog_addr: expected host:port, got \"" + **addr + "\""};
    }
    watched.graylog_addr = **addr;

    auto compression = string_field(tbl, "compression");
    if (!compression) return compression.error();
    if (*compression) {
        auto parsed = gelf::parse_compression(**compression);
        if (!parsed) return unknown_value("compression", **compression);
        watched.compression = *parsed;
    }

    auto team = name_field(tbl, "team");
    if (!team) return team.error();
    watched.team = *team;

    auto service = name_field(tbl, "service");
    if (!service) return service.error();
    watched.service = *service;

    auto system_level = string_field(tbl, "log_level_system");
    if (!system_level) return system_level.error();
    if (*system_level) {
        auto parsed = gelf::parse_system_level(**system_level);
        if (!parsed) return unknown_value("log_level_system", **system_level);
        watched.log_level_system = *parsed;
    }

    auto message_level = string_field(tbl, "log_level_message");
    if (!message_level) return message_level.error();
    if (*message_level) {
        auto parsed = gelf::parse_message_level(**message_level);
        if (!parsed) return unknown_value("log_level_message", **message_level);
        watched.log_level_message = *parsed;
    }

    return Result<void>{};
}

Result<void> read_global(const toml::table& tbl, GlobalConfig& global) {
    auto source = string_field(tbl, "log_source");
    if (!source) return source.error();
    if (*source) {
        auto parsed = parse_log_source(**source);
        if (!parsed) return unknown_value("global.log_source", **source);
        global.log_source = *parsed;
    }

    auto port = integer_field(tbl, "sender_port");
    if (!port) return port.error();
    if (*port) {
        if (**port < 0 || **port > 65535) {
            return Error{ErrorKind::ParsingFailure,
                         "global.sender_port: out of range: " + std::to_string(**port)};
        }
        global.sender_port = static_cast<uint16_t>(**port);
    }

    return Result<void>{};
}

Result<void> read_logging(const toml::table& tbl, LoggingConfig& logging) {
    auto level = string_field(tbl, "level");
    if (!level) return level.error();
    if (*level) {
        if (!parse_log_level(**level)) return unknown_value("logging.level", **level);
        logging.level = **level;
    }

    auto file = string_field(tbl, "file");
    if (!file) return file.error();
    if (*file) logging.file = std::filesystem::path{**file};

    return Result<void>{};
}

}  // anonymous namespace

std::optional<LogSource> parse_log_source(std::string_view name) noexcept {
    if (name == "stdin") return LogSource::Stdin;
    if (name == "journal") return LogSource::Journal;
    return std::nullopt;
}

bool is_valid_address(std::string_view address) noexcept {
    auto colon = address.rfind(':');
    if (colon == std::string_view::npos || colon == 0) return false;

    auto port_text = address.substr(colon + 1);
    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size()) return false;
    return port >= 1 && port <= 65535;
}

Result<Config> parse_config(std::string_view document) {
    try {
        auto tbl = toml::parse(document);
        Config config;

        if (auto result = read_watched(tbl, config.watched); !result) {
            return result.error();
        }

        // [global]
        if (const toml::node* global = tbl.get("global")) {
            const auto* global_tbl = global->as_table();
            if (global_tbl == nullptr) return type_error("global", "a table");
            if (auto result = read_global(*global_tbl, config.global); !result) {
                return result.error();
            }
        }

        // [logging]
        if (const toml::node* logging = tbl.get("logging")) {
            const auto* logging_tbl = logging->as_table();
            if (logging_tbl == nullptr) return type_error("logging", "a table");
            if (auto result = read_logging(*logging_tbl, config.logging); !result) {
                return result.error();
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::ParsingFailure,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorKind::IoFailure, "Cannot read configuration file: " + path.string()};
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    auto config = parse_config(contents.str());
    if (!config) {
        return Error{config.error().kind, path.string() + ": " + config.error().message};
    }
    return config;
}

Config default_config() {
    return Config{};
}

}  // namespace gelf_relay
