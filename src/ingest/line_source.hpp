/**
 * @file line_source.hpp
 * @brief Line-oriented inputs for the ingestion loop.
 *
 * Reads use poll() with a short timeout so a blocked reader still notices a
 * stop request.
 */

#pragma once

#include "core/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace gelf_relay {

/**
 * @brief Source of newline-delimited records.
 */
class ILineSource {
public:
    virtual ~ILineSource() = default;

    /**
     * @brief Block until a full line is available.
     * @return the line without its terminator; nullopt at end of input or
     *         when @p stop is requested; an error when the source fails.
     */
    virtual Result<std::optional<std::string>> next_line(std::stop_token stop) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Buffered line reader over a file descriptor.
 *
 * A final line without a terminating newline is returned before end of input.
 * A line longer than the maximum length is returned truncated to that length
 * and the rest of it, up to the next newline, is discarded.
 */
class FdLineSource : public ILineSource {
public:
    static constexpr int POLL_INTERVAL_MS = 100;
    static constexpr size_t READ_CHUNK = 64 * 1024;
    static constexpr size_t MAX_LINE_LENGTH = 8 * 1024 * 1024;

    explicit FdLineSource(int fd, bool owns_fd = false, std::string name = "fd",
                          size_t max_line_length = MAX_LINE_LENGTH);
    ~FdLineSource() override;

    // Non-copyable
    FdLineSource(const FdLineSource&) = delete;
    FdLineSource& operator=(const FdLineSource&) = delete;

    Result<std::optional<std::string>> next_line(std::stop_token stop) override;
    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    [[nodiscard]] bool at_eof() const noexcept { return eof_ && start_ == buffer_.size(); }

private:
    std::optional<std::string> take_line();
    void reset_buffer();

    int fd_;
    bool owns_fd_;
    std::string name_;
    size_t max_line_length_;
    std::string buffer_;
    size_t start_ = 0;        ///< first unconsumed byte of buffer_
    size_t scanned_ = 0;      ///< bytes before this offset hold no newline
    bool discarding_ = false; ///< dropping the tail of a truncated line
    bool eof_ = false;
};

/**
 * @brief Standard input; ends at end of input.
 */
class StdinSource : public FdLineSource {
public:
    StdinSource();
};

/**
 * @brief Follows `journalctl -o json -f` through a pipe.
 *
 * The subprocess is expected to run forever. When its stdout reaches end of
 * input the accumulated stderr text becomes an IoFailure for the loop.
 */
class JournalSource : public ILineSource {
public:
    static const std::vector<std::string>& default_command();

    /**
     * @brief Fork and exec the journal reader. Linux only.
     */
    static Result<std::unique_ptr<JournalSource>> spawn(
        const std::vector<std::string>& argv = default_command());

    ~JournalSource() override;

    // Non-copyable
    JournalSource(const JournalSource&) = delete;
    JournalSource& operator=(const JournalSource&) = delete;

    Result<std::optional<std::string>> next_line(std::stop_token stop) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "journal"; }

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    JournalSource(pid_t pid, int stdout_fd, int stderr_fd);

    std::string drain_stderr();
    int reap(bool terminate);

    pid_t pid_;
    FdLineSource stdout_;
    int stderr_fd_;
};

}  // namespace gelf_relay
