/**
 * @file line_source.cpp
 * @brief poll()-driven line readers and the journalctl subprocess.
 */

#include "ingest/line_source.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gelf_relay {

namespace {

constexpr int STDERR_DRAIN_TIMEOUT_MS = 1000;

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

std::string trim_trailing_whitespace(std::string text) {
    auto last = text.find_last_not_of(" \t\r\n");
    text.erase(last == std::string::npos ? 0 : last + 1);
    return text;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// FdLineSource
// ─────────────────────────────────────────────

FdLineSource::FdLineSource(int fd, bool owns_fd, std::string name, size_t max_line_length)
    : fd_(fd), owns_fd_(owns_fd), name_(std::move(name)), max_line_length_(max_line_length) {}

FdLineSource::~FdLineSource() {
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void FdLineSource::reset_buffer() {
    buffer_.clear();
    start_ = 0;
    scanned_ = 0;
}

std::optional<std::string> FdLineSource::take_line() {
    while (true) {
        auto newline = buffer_.find('\n', scanned_);
        if (newline == std::string::npos) {
            if (discarding_) {
                reset_buffer();
                return std::nullopt;
            }
            if (buffer_.size() - start_ > max_line_length_) {
                std::string line = buffer_.substr(start_, max_line_length_);
                discarding_ = true;
                reset_buffer();
                return line;
            }
            // Consumed lines are dropped once per read, not once per line
            buffer_.erase(0, start_);
            scanned_ = buffer_.size();
            start_ = 0;
            return std::nullopt;
        }

        const size_t line_begin = start_;
        start_ = newline + 1;
        scanned_ = start_;
        if (discarding_) {
            discarding_ = false;
            continue;
        }
        return buffer_.substr(line_begin, std::min(newline - line_begin, max_line_length_));
    }
}

Result<std::optional<std::string>> FdLineSource::next_line(std::stop_token stop) {
    char chunk[READ_CHUNK];

    while (true) {
        if (auto line = take_line()) {
            return line;
        }

        if (eof_) {
            if (discarding_ || start_ == buffer_.size()) {
                discarding_ = false;
                reset_buffer();
                return std::optional<std::string>{};
            }
            std::string rest = buffer_.substr(start_);
            reset_buffer();
            return std::optional<std::string>{std::move(rest)};
        }

        if (stop.stop_requested()) return std::optional<std::string>{};

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return Error{ErrorKind::IoFailure,
                         "poll on " + name_ + " failed: " + std::string(strerror(errno))};
        }
        if (ready == 0) continue;

        auto received = ::read(fd_, chunk, sizeof(chunk));
        if (received > 0) {
            buffer_.append(chunk, static_cast<size_t>(received));
        } else if (received == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            return Error{ErrorKind::IoFailure,
                         "read from " + name_ + " failed: " + std::string(strerror(errno))};
        }
    }
}

// ─────────────────────────────────────────────
// StdinSource
// ─────────────────────────────────────────────

StdinSource::StdinSource()
    : FdLineSource(STDIN_FILENO, false, "stdin") {}

// ─────────────────────────────────────────────
// JournalSource
// ─────────────────────────────────────────────

const std::vector<std::string>& JournalSource::default_command() {
    static const std::vector<std::string> command{"journalctl", "-o", "json", "-f"};
    return command;
}

JournalSource::JournalSource(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid)
    , stdout_(stdout_fd, true, "journal stdout")
    , stderr_fd_(stderr_fd) {}

JournalSource::~JournalSource() {
    reap(true);
    if (stderr_fd_ >= 0) {
        ::close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

Result<std::unique_ptr<JournalSource>> JournalSource::spawn(const std::vector<std::string>& argv) {
#ifndef __linux__
    (void)argv;
    return Error{ErrorKind::InternalFailure, "operating system currently unsupported"};
#else
    if (argv.empty()) {
        return Error{ErrorKind::InternalFailure, "Empty journal reader command"};
    }

    // Prepared before fork(): only async-signal-safe calls run in the child.
    const std::string exec_failure = "failed to exec journal reader: " + argv.front() + "\n";
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
    args.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto reason = std::string(strerror(errno));
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        return Error{ErrorKind::IoFailure, "Failed to create pipes: " + reason};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto reason = std::string(strerror(errno));
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        return Error{ErrorKind::IoFailure, "Failed to fork journal reader: " + reason};
    }

    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());

        if (::write(STDERR_FILENO, exec_failure.data(), exec_failure.size()) < 0) ::_exit(126);
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    return std::unique_ptr<JournalSource>(new JournalSource(pid, out_pipe[0], err_pipe[0]));
#endif
}

Result<std::optional<std::string>> JournalSource::next_line(std::stop_token stop) {
    auto line = stdout_.next_line(stop);
    if (!line) return line.error();
    if (*line || stop.stop_requested()) return line;

    // stdout closed: the reader died, its stderr says why
    auto diagnostics = trim_trailing_whitespace(drain_stderr());
    int status = reap(false);

    std::string message = diagnostics.empty() ? "journal reader exited" : diagnostics;
    if (status >= 0 && WIFEXITED(status)) {
        message += " (exit status " + std::to_string(WEXITSTATUS(status)) + ")";
    }
    return Error{ErrorKind::IoFailure, message};
}

std::string JournalSource::drain_stderr() {
    std::string collected;
    if (stderr_fd_ < 0) return collected;

    char chunk[4096];
    while (true) {
        pollfd pfd{};
        pfd.fd = stderr_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, STDERR_DRAIN_TIMEOUT_MS);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) break;

        auto received = ::read(stderr_fd_, chunk, sizeof(chunk));
        if (received < 0 && errno == EINTR) continue;
        if (received <= 0) break;
        collected.append(chunk, static_cast<size_t>(received));
    }
    return collected;
}

int JournalSource::reap(bool terminate) {
    if (pid_ <= 0) return -1;

    if (terminate) ::kill(pid_, SIGTERM);

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    pid_ = -1;
    return result < 0 ? -1 : status;
}

}  // namespace gelf_relay
