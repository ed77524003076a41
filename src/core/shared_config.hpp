/**
 * @file shared_config.hpp
 * @brief Hot-reload hand-off between the config watcher and the ingestion loop.
 *
 * Single writer (watcher), single reader (loop). The watcher replaces the
 * value under the mutex and raises a relaxed atomic flag; the loop polls the
 * flag once per record and clones the value when it is set. Staleness is
 * bounded to one loop iteration.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>

namespace gelf_relay {

class SharedConfig {
public:
    explicit SharedConfig(WatchedConfig initial);

    // Non-copyable
    SharedConfig(const SharedConfig&) = delete;
    SharedConfig& operator=(const SharedConfig&) = delete;

    /// Replace the shared value and raise the change flag.
    void publish(WatchedConfig watched);

    /// Clone of the current value.
    [[nodiscard]] WatchedConfig snapshot() const;

    /// Non-blocking check of the change flag.
    [[nodiscard]] bool changed() const noexcept;

    /**
     * @brief Clear the flag and return the current value if it was set.
     *
     * The flag is cleared before cloning, so a publish racing with this call
     * is picked up on the next poll at worst.
     */
    [[nodiscard]] std::optional<WatchedConfig> take_if_changed();

private:
    mutable std::mutex mutex_;
    WatchedConfig watched_;
    std::atomic<bool> changed_{false};
};

/**
 * @brief Copy every field of @p update that differs from @p current.
 *
 * Each change is logged at info level as "<field>: <old> -> <new>".
 * @return number of fields changed.
 */
size_t merge_watched(WatchedConfig& current, const WatchedConfig& update, Logger& logger);

}  // namespace gelf_relay
