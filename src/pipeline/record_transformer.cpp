/**
 * @file record_transformer.cpp
 * @brief Record → GELF transformation.
 */

#include "pipeline/record_transformer.hpp"

#include "gelf/compression.hpp"
#include "gelf/message.hpp"

#include <algorithm>
#include <charconv>
#include <string>

namespace gelf_relay {

namespace {

constexpr double MICROS_PER_SECOND = 1'000'000.0;

/// Strings are taken verbatim; any other JSON value is serialized.
std::string text_of(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<uint64_t> parse_unsigned(const nlohmann::json& value) {
    if (value.is_number_unsigned()) return value.get<uint64_t>();
    if (!value.is_string()) return std::nullopt;

    const auto& text = value.get_ref<const std::string&>();
    uint64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return parsed;
}

/// journald exports __REALTIME_TIMESTAMP as a decimal string of microseconds.
std::optional<double> parse_realtime_seconds(const nlohmann::json& value) {
    if (value.is_number()) return value.get<double>() / MICROS_PER_SECOND;
    if (auto micros = parse_unsigned(value)) {
        return static_cast<double>(*micros) / MICROS_PER_SECOND;
    }
    return std::nullopt;
}

constexpr bool is_ascii_letter(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

constexpr char ascii_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

/// @p key must be lowercase.
bool starts_with_icase(std::string_view text, std::string_view key) noexcept {
    if (text.size() < key.size()) return false;
    for (size_t i = 0; i < key.size(); ++i) {
        if (ascii_lower(text[i]) != key[i]) return false;
    }
    return true;
}

}  // anonymous namespace

bool is_metadata_field(std::string_view field) noexcept {
    return std::find(IGNORED_FIELDS.begin(), IGNORED_FIELDS.end(), field)
           == IGNORED_FIELDS.end();
}

std::optional<gelf::MessageLevel> extract_message_level(std::string_view text) {
    // A trailing space is part of the token: "level=error disk full" matches,
    // a bare "level=error" at the end of the text does not. A letter run stops
    // at the next '=', so each character is scanned a bounded number of times.
    constexpr std::string_view key = "level=";

    for (size_t pos = 0; pos + key.size() < text.size(); ++pos) {
        if (!starts_with_icase(text.substr(pos), key)) continue;

        const size_t word_begin = pos + key.size();
        size_t word_end = word_begin;
        while (word_end < text.size() && is_ascii_letter(text[word_end])) ++word_end;

        if (word_end > word_begin && word_end < text.size() && text[word_end] == ' ') {
            return gelf::message_level_from_word(text.substr(word_begin, word_end - word_begin));
        }
    }
    return std::nullopt;
}

Result<gelf::WireMessage> build_message(const nlohmann::json& record,
                                        const WatchedConfig& config) {
    auto message_it = record.find("MESSAGE");
    if (message_it == record.end()) {
        return Error{ErrorKind::NoMessage, "no MESSAGE field found"};
    }
    auto short_message = text_of(*message_it);

    auto host_it = record.find("_HOSTNAME");
    auto host = host_it != record.end() ? text_of(*host_it) : std::string{UNDEFINED_HOST};

    // filter by message level
    if (config.log_level_message) {
        if (auto level = extract_message_level(short_message);
            level && *level > *config.log_level_message) {
            return Error{ErrorKind::InsufficientLogLevel,
                         "message level " + std::string{gelf::to_string(*level)}
                         + " below threshold"};
        }
    }

    gelf::Message message(std::move(host), std::move(short_message));

    // filter by system level
    if (auto priority_it = record.find("PRIORITY"); priority_it != record.end()) {
        if (auto code = parse_unsigned(*priority_it)) {
            auto level = gelf::system_level_from_code(*code);
            if (level > config.log_level_system) {
                return Error{ErrorKind::InsufficientLogLevel,
                             "system level " + std::string{gelf::to_string(level)}
                             + " below threshold"};
            }
            message.set_level(level);
        }
    }

    if (auto ts_it = record.find("__REALTIME_TIMESTAMP"); ts_it != record.end()) {
        if (auto seconds = parse_realtime_seconds(*ts_it)) {
            message.set_timestamp(*seconds);
        }
    }

    for (const auto& [key, value] : record.items()) {
        if (!is_metadata_field(key)) continue;
        // "id" is reserved by GELF and silently dropped
        (void)message.set_metadata(key, value);
    }

    return gelf::WireMessage{std::move(message), config.team, config.service};
}

Result<std::vector<uint8_t>> transform_record(std::string_view line,
                                              const WatchedConfig& config) {
    nlohmann::json record;
    try {
        record = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& err) {
        return Error{ErrorKind::ParsingFailure, err.what()};
    }

    if (!record.is_object()) {
        return Error{ErrorKind::ParsingFailure, "record is not a JSON object"};
    }

    auto wire = build_message(record, config);
    if (!wire) return wire.error();

    return gelf::compress(config.compression, *wire);
}

}  // namespace gelf_relay
