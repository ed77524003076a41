/**
 * @file shared_config.cpp
 * @brief SharedConfig and field-wise merge.
 */

#include "core/shared_config.hpp"

#include <string>
#include <utility>

namespace gelf_relay {

namespace {

std::string describe(const std::string& value) { return value; }

std::string describe(const std::optional<std::string>& value) {
    return value ? *value : "<unset>";
}

template <typename Enum>
std::string describe(Enum value) {
    return std::string{to_string(value)};
}

template <typename Enum>
std::string describe(const std::optional<Enum>& value) {
    return value ? std::string{to_string(*value)} : "<unset>";
}

template <typename T>
void merge_field(std::string_view name, T& current, const T& update,
                 Logger& logger, size_t& changes) {
    if (current == update) return;
    logger.info("config " + std::string{name} + ": " + describe(current)
                + " -> " + describe(update));
    current = update;
    ++changes;
}

}  // anonymous namespace

SharedConfig::SharedConfig(WatchedConfig initial)
    : watched_(std::move(initial)) {}

void SharedConfig::publish(WatchedConfig watched) {
    {
        std::lock_guard lock(mutex_);
        watched_ = std::move(watched);
    }
    changed_.store(true, std::memory_order_relaxed);
}

WatchedConfig SharedConfig::snapshot() const {
    std::lock_guard lock(mutex_);
    return watched_;
}

bool SharedConfig::changed() const noexcept {
    return changed_.load(std::memory_order_relaxed);
}

std::optional<WatchedConfig> SharedConfig::take_if_changed() {
    if (!changed_.load(std::memory_order_relaxed)) return std::nullopt;
    changed_.store(false, std::memory_order_relaxed);
    return snapshot();
}

size_t merge_watched(WatchedConfig& current, const WatchedConfig& update, Logger& logger) {
    size_t changes = 0;
    merge_field("graylog_addr", current.graylog_addr, update.graylog_addr, logger, changes);
    merge_field("compression", current.compression, update.compression, logger, changes);
    merge_field("team", current.team, update.team, logger, changes);
    merge_field("service", current.service, update.service, logger, changes);
    merge_field("log_level_system", current.log_level_system, update.log_level_system,
                logger, changes);
    merge_field("log_level_message", current.log_level_message, update.log_level_message,
                logger, changes);
    return changes;
}

}  // namespace gelf_relay
