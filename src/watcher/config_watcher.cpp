/**
 * @file config_watcher.cpp
 * @brief ConfigWatcher implementation using inotify and poll().
 */

#include "watcher/config_watcher.hpp"

#include <cerrno>
#include <climits>
#include <cstring>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace gelf_relay {

namespace {

constexpr uint32_t WRITE_EVENTS = IN_CLOSE_WRITE | IN_MODIFY | IN_CREATE | IN_MOVED_TO;
constexpr uint32_t GONE_EVENTS = IN_DELETE | IN_MOVED_FROM;
constexpr uint32_t DIRECTORY_GONE_EVENTS = IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED;
constexpr int POLL_INTERVAL_MS = 100;
constexpr size_t EVENT_BUFFER_SIZE = 16 * (sizeof(inotify_event) + NAME_MAX + 1);

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

ConfigWatcher::ConfigWatcher(std::filesystem::path path,
                             GlobalConfig initial_global,
                             SharedConfig& shared,
                             Logger& logger,
                             std::chrono::milliseconds debounce)
    : path_(std::move(path))
    , file_name_(path_.filename().string())
    , global_(initial_global)
    , shared_(shared)
    , logger_(logger)
    , debounce_(debounce) {}

ConfigWatcher::~ConfigWatcher() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> ConfigWatcher::start() {
    if (inotify_fd_ >= 0) {
        return Error{ErrorKind::InternalFailure, "Config watcher already running"};
    }

    inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        return Error{ErrorKind::IoFailure,
                     "Failed to initialize inotify: " + std::string(strerror(errno))};
    }

    auto dir = path_.has_parent_path() ? path_.parent_path() : std::filesystem::path{"."};
    watch_descriptor_ = ::inotify_add_watch(inotify_fd_, dir.c_str(),
                                            WRITE_EVENTS | GONE_EVENTS
                                            | IN_DELETE_SELF | IN_MOVE_SELF);
    if (watch_descriptor_ < 0) {
        auto reason = std::string(strerror(errno));
        ::close(inotify_fd_);
        inotify_fd_ = -1;
        return Error{ErrorKind::IoFailure,
                     "Failed to watch " + dir.string() + ": " + reason};
    }

    active_.store(true);
    watch_thread_ = std::jthread([this](std::stop_token stop) {
        watch_loop(stop);
        active_.store(false);
    });

    logger_.info("Watching " + path_.string() + " for changes (debounce "
                 + std::to_string(debounce_.count()) + "ms)");
    return Result<void>{};
}

void ConfigWatcher::stop() {
    if (watch_thread_.joinable()) {
        watch_thread_.request_stop();
        watch_thread_.join();
    }
    if (inotify_fd_ >= 0) {
        if (watch_descriptor_ >= 0) {
            ::inotify_rm_watch(inotify_fd_, watch_descriptor_);
            watch_descriptor_ = -1;
        }
        ::close(inotify_fd_);
        inotify_fd_ = -1;
    }
}

bool ConfigWatcher::is_running() const noexcept {
    return active_.load();
}

uint64_t ConfigWatcher::reload_count() const noexcept {
    return reloads_.load(std::memory_order_relaxed);
}

uint64_t ConfigWatcher::failed_reload_count() const noexcept {
    return failed_reloads_.load(std::memory_order_relaxed);
}

// ─────────────────────────────────────────────
// Watcher Thread
// ─────────────────────────────────────────────

void ConfigWatcher::watch_loop(std::stop_token stop) {
    bool pending = false;
    auto quiet_since = std::chrono::steady_clock::now();

    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = inotify_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger_.error("Config watcher poll failed: " + std::string(strerror(errno)));
            break;
        }

        if (ready > 0) {
            bool armed = false;
            if (!drain_events(armed)) {
                logger_.error("Directory of " + path_.string()
                              + " was removed or moved; configuration is no longer watched");
                break;
            }
            if (armed) {
                // Every new write restarts the quiescence window
                pending = true;
                quiet_since = std::chrono::steady_clock::now();
            }
        }

        if (pending && std::chrono::steady_clock::now() - quiet_since >= debounce_) {
            pending = false;
            reload();
        }
    }
}

bool ConfigWatcher::drain_events(bool& pending) {
    alignas(inotify_event) char buffer[EVENT_BUFFER_SIZE];

    while (true) {
        auto length = ::read(inotify_fd_, buffer, sizeof(buffer));
        if (length <= 0) {
            if (length < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                logger_.error("Config watcher read failed: " + std::string(strerror(errno)));
            }
            return true;
        }

        for (ssize_t offset = 0; offset < length;) {
            const auto* event = reinterpret_cast<const inotify_event*>(buffer + offset);
            offset += static_cast<ssize_t>(sizeof(inotify_event) + event->len);

            if (event->wd == watch_descriptor_ && (event->mask & DIRECTORY_GONE_EVENTS)) {
                return false;
            }
            if (event->mask & IN_Q_OVERFLOW) {
                pending = true;
                continue;
            }
            if (event->len == 0 || file_name_ != event->name) continue;

            if (event->mask & WRITE_EVENTS) {
                pending = true;
            } else if (event->mask & GONE_EVENTS) {
                logger_.warn("Configuration file " + path_.string()
                             + " was removed or moved; keeping last good configuration");
            }
        }
    }
}

void ConfigWatcher::reload() {
    auto config = load_config(path_);
    if (!config) {
        failed_reloads_.fetch_add(1, std::memory_order_relaxed);
        logger_.error("Config reload failed, keeping previous configuration: "
                      + config.error().describe());
        return;
    }

    if (!(config->global == global_)) {
        logger_.warn("Changes to the [global] section take effect after restart");
        global_ = config->global;
    }

    shared_.publish(config->watched);
    reloads_.fetch_add(1, std::memory_order_relaxed);
    logger_.info("Configuration reloaded from " + path_.string());
}

}  // namespace gelf_relay
