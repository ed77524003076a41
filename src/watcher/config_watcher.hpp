/**
 * @file config_watcher.hpp
 * @brief inotify-based configuration file watcher with debounced reload.
 *
 * Watches the directory holding the configuration file rather than the file
 * itself, so editors that save by writing a temporary file and renaming it
 * over the original keep being observed. Write events arm a quiescence
 * timer; the file is re-parsed once no further event has arrived for the
 * debounce window.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/shared_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>

namespace gelf_relay {

class ConfigWatcher {
public:
    static constexpr std::chrono::milliseconds DEFAULT_DEBOUNCE{2000};

    /**
     * @param initial_global the [global] section in effect; changes to it are
     *        reported but need a restart.
     */
    ConfigWatcher(std::filesystem::path path,
                  GlobalConfig initial_global,
                  SharedConfig& shared,
                  Logger& logger,
                  std::chrono::milliseconds debounce = DEFAULT_DEBOUNCE);
    ~ConfigWatcher();

    // Non-copyable
    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    /// Set up inotify and launch the watcher thread.
    Result<void> start();
    void stop();

    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] uint64_t reload_count() const noexcept;
    [[nodiscard]] uint64_t failed_reload_count() const noexcept;

private:
    void watch_loop(std::stop_token stop);
    /// @return false once the watched directory itself is gone.
    bool drain_events(bool& pending);
    void reload();

    std::filesystem::path path_;
    std::string file_name_;
    GlobalConfig global_;
    SharedConfig& shared_;
    Logger& logger_;
    std::chrono::milliseconds debounce_;

    int inotify_fd_ = -1;
    int watch_descriptor_ = -1;
    std::atomic<bool> active_{false};
    std::jthread watch_thread_;

    std::atomic<uint64_t> reloads_{0};
    std::atomic<uint64_t> failed_reloads_{0};
};

}  // namespace gelf_relay
