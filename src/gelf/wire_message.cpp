/**
 * @file wire_message.cpp
 * @brief GELF envelope serialization.
 */

#include "gelf/wire_message.hpp"

#include <chrono>
#include <utility>

namespace gelf_relay::gelf {

WireMessage::WireMessage(Message message,
                         std::optional<std::string> team,
                         std::optional<std::string> service)
    : message_(std::move(message))
    , team_(std::move(team))
    , service_(std::move(service)) {}

nlohmann::json WireMessage::to_json() const {
    nlohmann::json doc = nlohmann::json::object();

    doc["version"] = GELF_VERSION;
    doc["host"] = trim_wrapping(message_.host());
    doc["short_message"] = trim_wrapping(message_.short_message());
    doc["level"] = to_code(message_.level());

    if (message_.full_message()) {
        doc["full_message"] = *message_.full_message();
    }

    doc["timestamp"] = message_.timestamp().value_or(current_time_unix());

    if (team_) doc["team"] = *team_;
    if (service_) doc["service"] = *service_;

    for (const auto& [key, value] : message_.all_metadata()) {
        doc["_" + key] = value;
    }

    return doc;
}

Result<std::string> WireMessage::to_gelf() const {
    try {
        return to_json().dump();
    } catch (const nlohmann::json::exception& err) {
        // dump() rejects strings that are not valid UTF-8
        return Error{ErrorKind::ParsingFailure,
                     std::string{"GELF serialization failed: "} + err.what()};
    }
}

double current_time_unix() noexcept {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

std::string_view trim_wrapping(std::string_view text) noexcept {
    constexpr std::string_view symbols = "\" ";
    auto first = text.find_first_not_of(symbols);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(symbols);
    return text.substr(first, last - first + 1);
}

}  // namespace gelf_relay::gelf
