/**
 * @file ingestion_loop.cpp
 * @brief IngestionLoop implementation.
 */

#include "ingest/ingestion_loop.hpp"

#include "pipeline/record_transformer.hpp"

#include <string>
#include <utility>

namespace gelf_relay {

namespace {

std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

}  // anonymous namespace

IngestionLoop::IngestionLoop(WatchedConfig initial,
                             SharedConfig& shared,
                             ILineSource& source,
                             IDatagramSender& sender,
                             Logger& logger)
    : current_(std::move(initial))
    , shared_(shared)
    , source_(source)
    , sender_(sender)
    , logger_(logger) {}

Result<void> IngestionLoop::run(std::stop_token stop) {
    logger_.debug("Start reading from " + std::string{source_.name()});

    while (!stop.stop_requested()) {
        auto line = source_.next_line(stop);
        if (!line) {
            return line.error();
        }
        if (!*line) break;  // end of input or stop

        stats_.lines_read.fetch_add(1, std::memory_order_relaxed);
        process_line(**line);
    }

    logger_.debug("Stopped reading from " + std::string{source_.name()});
    return Result<void>{};
}

void IngestionLoop::process_line(std::string_view raw) {
    auto line = trim(raw);
    if (line.empty()) return;

    apply_pending_config();

    auto payload = transform_record(line, current_);
    if (payload) {
        send_payload(std::move(*payload));
        return;
    }

    report_rejection(payload.error(), line);
}

void IngestionLoop::report_rejection(const Error& err, std::string_view line) {
    switch (err.kind) {
        case ErrorKind::InsufficientLogLevel:
            stats_.records_filtered.fetch_add(1, std::memory_order_relaxed);
            break;
        case ErrorKind::NoMessage:
            stats_.records_dropped.fetch_add(1, std::memory_order_relaxed);
            logger_.debug("No MESSAGE field found");
            break;
        case ErrorKind::ParsingFailure:
            stats_.records_dropped.fetch_add(1, std::memory_order_relaxed);
            logger_.warn("Parsing error: " + err.describe() + ", message: " + std::string{line});
            break;
        default:
            stats_.records_dropped.fetch_add(1, std::memory_order_relaxed);
            logger_.error("Record dropped: " + err.describe() + ", message: " + std::string{line});
            break;
    }
}

void IngestionLoop::apply_pending_config() {
    auto update = shared_.take_if_changed();
    if (!update) return;

    auto changes = merge_watched(current_, *update, logger_);
    stats_.config_reloads.fetch_add(1, std::memory_order_relaxed);
    if (changes == 0) {
        logger_.debug("Configuration reloaded without changes");
    }
}

void IngestionLoop::send_payload(std::vector<uint8_t> payload) {
    auto chunked = gelf::ChunkedMessage::create(CHUNK_SIZE, std::move(payload));
    if (!chunked) {
        stats_.records_dropped.fetch_add(1, std::memory_order_relaxed);
        logger_.error(chunked.error().describe());
        return;
    }

    bool all_sent = true;
    for (const auto& datagram : *chunked) {
        auto sent = sender_.send(datagram, current_.graylog_addr);
        if (!sent) {
            all_sent = false;
            stats_.send_failures.fetch_add(1, std::memory_order_relaxed);
            logger_.error("Sender failure: " + sent.error().describe());
            continue;
        }
        stats_.datagrams_sent.fetch_add(1, std::memory_order_relaxed);
    }

    if (all_sent) {
        stats_.records_sent.fetch_add(1, std::memory_order_relaxed);
    }
}

}  // namespace gelf_relay
