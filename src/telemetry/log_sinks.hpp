/**
 * @file log_sinks.hpp
 * @brief NDJSON log sinks: stderr, append-only file, null.
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>

namespace gelf_relay {

/**
 * @brief Appends NDJSON to a log file, creating parent directories.
 */
class JsonFileSink : public ILogSink {
public:
    explicit JsonFileSink(const std::filesystem::path& path);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] bool is_open() const noexcept { return file_.is_open(); }

private:
    std::ofstream file_;
};

/**
 * @brief Writes to stderr. stdout stays free for piping.
 */
class StderrSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace gelf_relay
