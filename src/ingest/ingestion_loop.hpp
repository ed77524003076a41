/**
 * @file ingestion_loop.hpp
 * @brief Read → reload → transform → chunk → send.
 *
 * The loop owns a private working copy of the watched configuration and
 * merges pending changes from SharedConfig before each record, so a reload
 * is visible to the very next record without restarting the loop.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/shared_config.hpp"
#include "gelf/chunked_message.hpp"
#include "ingest/line_source.hpp"
#include "network/udp_sender.hpp"

#include <atomic>
#include <cstdint>
#include <string_view>
#include <thread>
#include <vector>

namespace gelf_relay {

/**
 * @brief Counters, readable from other threads while the loop runs.
 */
struct LoopStats {
    std::atomic<uint64_t> lines_read{0};
    std::atomic<uint64_t> records_sent{0};
    std::atomic<uint64_t> records_filtered{0};
    std::atomic<uint64_t> records_dropped{0};   ///< parse, missing MESSAGE, encode or chunk errors
    std::atomic<uint64_t> datagrams_sent{0};
    std::atomic<uint64_t> send_failures{0};
    std::atomic<uint64_t> config_reloads{0};
};

class IngestionLoop {
public:
    static constexpr gelf::ChunkSize CHUNK_SIZE = gelf::ChunkSize::Wan;

    IngestionLoop(WatchedConfig initial,
                  SharedConfig& shared,
                  ILineSource& source,
                  IDatagramSender& sender,
                  Logger& logger);

    /**
     * @brief Process lines until the source ends, fails, or stop is requested.
     * @return success at end of input or on stop; the source's error otherwise.
     */
    Result<void> run(std::stop_token stop);

    /// Handle one raw line; exposed for tests.
    void process_line(std::string_view line);

    /// Count and log a record that produced no payload; exposed for tests.
    void report_rejection(const Error& err, std::string_view line);

    [[nodiscard]] const LoopStats& stats() const noexcept { return stats_; }

    /// Working copy; only meaningful from the loop's own thread.
    [[nodiscard]] const WatchedConfig& current_config() const noexcept { return current_; }

private:
    void apply_pending_config();
    void send_payload(std::vector<uint8_t> payload);

    WatchedConfig current_;
    SharedConfig& shared_;
    ILineSource& source_;
    IDatagramSender& sender_;
    Logger& logger_;
    LoopStats stats_;
};

}  // namespace gelf_relay
