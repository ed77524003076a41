/**
 * @file main.cpp
 * @brief gelf_relay daemon entry point.
 *
 * Wires the modules into the forwarding pipeline:
 *   Config → Logger → SharedConfig → ConfigWatcher ∥ IngestionLoop → UdpSender
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/shared_config.hpp"
#include "ingest/ingestion_loop.hpp"
#include "ingest/line_source.hpp"
#include "network/udp_sender.hpp"
#include "telemetry/log_sinks.hpp"
#include "watcher/config_watcher.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace gelf_relay;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr int EXIT_OK = 0;
constexpr int EXIT_FATAL = 1;

struct CLIArgs {
    std::filesystem::path config_path = "/etc/gelf_relay/config.toml";
    std::optional<LogSource> source;
    std::chrono::milliseconds debounce = ConfigWatcher::DEFAULT_DEBOUNCE;
    bool verbose = false;
};

void print_usage() {
    std::cout << "Usage: gelf_relay [OPTIONS]\n"
              << "Read JSON log records from stdin or journalctl and send them to Graylog as GELF.\n\n"
              << "  --config <path>        Configuration file (default: /etc/gelf_relay/config.toml)\n"
              << "  --source <stdin|journal>  Override global.log_source\n"
              << "  --debounce-ms <ms>     Quiet period before a changed config is reloaded (default: 2000)\n"
              << "  --verbose              Debug logging\n"
              << "  --help, -h             Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--source" && i + 1 < argc) {
            args.source = parse_log_source(argv[++i]);
            if (!args.source) {
                std::cerr << "Unknown log source: " << argv[i] << "\n";
                return std::nullopt;
            }
        } else if (arg == "--debounce-ms" && i + 1 < argc) {
            std::string_view value = argv[++i];
            unsigned ms = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                std::cerr << "Bad --debounce-ms value: " << value << "\n";
                return std::nullopt;
            }
            args.debounce = std::chrono::milliseconds{ms};
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(EXIT_OK);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return std::nullopt;
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_log_sink(const LoggingConfig& logging) {
    if (logging.file) {
        auto sink = std::make_unique<JsonFileSink>(*logging.file);
        if (sink->is_open()) return sink;
        std::cerr << "Cannot open log file " << logging.file->string()
                  << ", logging to stderr\n";
    }
    return std::make_unique<StderrSink>();
}

Result<std::unique_ptr<ILineSource>> open_source(LogSource source) {
    switch (source) {
        case LogSource::Stdin:
            return std::unique_ptr<ILineSource>(std::make_unique<StdinSource>());
        case LogSource::Journal: {
            auto journal = JournalSource::spawn();
            if (!journal) return journal.error();
            return std::unique_ptr<ILineSource>(std::move(*journal));
        }
    }
    return Error{ErrorKind::InternalFailure, "unknown log source"};
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) return EXIT_FATAL;

    // Load configuration
    auto config_result = load_config(args->config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().describe() << std::endl;
        return EXIT_FATAL;
    }
    auto config = *config_result;
    if (args->source) config.global.log_source = *args->source;

    // ── Initialize Logger ────────────────────
    auto level = args->verbose ? LogLevel::Debug
                               : parse_log_level(config.logging.level).value_or(LogLevel::Info);
    Logger logger(make_log_sink(config.logging), level);
    logger.info("gelf_relay starting...");
    logger.info("Source: " + std::string{to_string(config.global.log_source)}
                + ", target: " + config.watched.graylog_addr
                + ", compression: " + std::string{gelf::to_string(config.watched.compression)});

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Shared configuration + watcher ───────
    SharedConfig shared(config.watched);
    ConfigWatcher watcher(args->config_path, config.global, shared, logger, args->debounce);
    if (auto started = watcher.start(); !started) {
        logger.warn("Config hot-reload disabled: " + started.error().describe());
    }

    // ── Sender socket ────────────────────────
    auto sender = UdpSender::bind(config.global.sender_port);
    if (!sender) {
        logger.error(sender.error().describe());
        return EXIT_FATAL;
    }
    logger.info("Sending from UDP port " + std::to_string((*sender)->local_port()));

    // ── Line source ──────────────────────────
    auto source = open_source(config.global.log_source);
    if (!source) {
        logger.error(std::string{to_string(config.global.log_source)}
                     + " processing stopped: " + source.error().describe());
        return EXIT_FATAL;
    }

    // ── Ingestion thread ─────────────────────
    IngestionLoop loop(config.watched, shared, **source, **sender, logger);
    std::atomic<bool> loop_done{false};
    std::optional<Error> loop_error;

    std::jthread ingest_thread([&](std::stop_token stop) {
        auto result = loop.run(stop);
        if (!result) loop_error = result.error();
        loop_done.store(true);
    });

    while (!g_shutdown_requested && !loop_done.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    if (g_shutdown_requested) logger.info("Shutdown requested. Cleaning up...");
    ingest_thread.request_stop();
    ingest_thread.join();
    watcher.stop();

    const auto& stats = loop.stats();
    logger.info("Lines read: " + std::to_string(stats.lines_read.load())
                + ", records sent: " + std::to_string(stats.records_sent.load())
                + ", filtered: " + std::to_string(stats.records_filtered.load())
                + ", dropped: " + std::to_string(stats.records_dropped.load())
                + ", send failures: " + std::to_string(stats.send_failures.load()));

    if (loop_error) {
        logger.error(std::string{to_string(config.global.log_source)}
                     + " processing stopped: " + loop_error->describe());
        logger.flush();
        return EXIT_FATAL;
    }

    logger.info("gelf_relay stopped.");
    logger.flush();
    return EXIT_OK;
}
