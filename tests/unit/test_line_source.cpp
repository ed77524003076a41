/**
 * @file test_line_source.cpp
 * @brief Unit tests for pipe-backed line readers and the journal subprocess.
 */

#include "ingest/line_source.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <unistd.h>

using namespace gelf_relay;
using namespace std::chrono_literals;

namespace {

/// Pipe whose write end is closed on demand.
struct Pipe {
    int read_fd = -1;
    int write_fd = -1;

    Pipe() {
        int fds[2];
        if (::pipe(fds) == 0) {
            read_fd = fds[0];
            write_fd = fds[1];
        }
    }

    ~Pipe() { close_write(); }

    void write(const std::string& text) const {
        ASSERT_EQ(::write(write_fd, text.data(), text.size()),
                  static_cast<ssize_t>(text.size()));
    }

    void close_write() {
        if (write_fd >= 0) {
            ::close(write_fd);
            write_fd = -1;
        }
    }
};

}  // namespace

TEST(FdLineSourceTest, SplitsLines) {
    Pipe pipe;
    ASSERT_GE(pipe.read_fd, 0);
    FdLineSource source(pipe.read_fd, true, "test");
    std::stop_source stop;

    pipe.write("first\nsecond\n");
    pipe.close_write();

    auto first = source.next_line(stop.get_token());
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "first");

    auto second = source.next_line(stop.get_token());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, "second");

    auto end = source.next_line(stop.get_token());
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(end->has_value());
    EXPECT_TRUE(source.at_eof());
}

TEST(FdLineSourceTest, ReturnsTrailingPartialLine) {
    Pipe pipe;
    FdLineSource source(pipe.read_fd, true);
    std::stop_source stop;

    pipe.write("complete\nno newline");
    pipe.close_write();

    EXPECT_EQ(*source.next_line(stop.get_token()), "complete");
    EXPECT_EQ(*source.next_line(stop.get_token()), "no newline");
    EXPECT_FALSE(source.next_line(stop.get_token())->has_value());
}

TEST(FdLineSourceTest, KeepsEmptyLines) {
    Pipe pipe;
    FdLineSource source(pipe.read_fd, true);
    std::stop_source stop;

    pipe.write("\n\nx\n");
    pipe.close_write();

    EXPECT_EQ(*source.next_line(stop.get_token()), "");
    EXPECT_EQ(*source.next_line(stop.get_token()), "");
    EXPECT_EQ(*source.next_line(stop.get_token()), "x");
}

TEST(FdLineSourceTest, LineAssembledAcrossWrites) {
    Pipe pipe;
    FdLineSource source(pipe.read_fd, true);
    std::stop_source stop;

    std::jthread writer([&pipe] {
        pipe.write(R"({"MESSAGE":)");
        std::this_thread::sleep_for(50ms);
        pipe.write("\"late\"}\n");
    });

    auto line = source.next_line(stop.get_token());
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, R"({"MESSAGE":"late"})");
}

TEST(FdLineSourceTest, OverlongLineIsTruncated) {
    Pipe pipe;
    FdLineSource source(pipe.read_fd, true, "test", 8);
    std::stop_source stop;

    pipe.write("0123456789abcdef\nshort\n");
    pipe.close_write();

    auto first = source.next_line(stop.get_token());
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->value_or(""), "01234567");

    auto second = source.next_line(stop.get_token());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->value_or(""), "short");
}

TEST(FdLineSourceTest, UnterminatedInputDoesNotGrowWithoutBound) {
    Pipe pipe;
    FdLineSource source(pipe.read_fd, true, "test", 1024);
    std::stop_source stop;

    std::jthread writer([&pipe] {
        pipe.write(std::string(256 * 1024, 'x'));
        std::this_thread::sleep_for(50ms);
        pipe.write("tail of the long line\nafter\n");
        pipe.close_write();
    });

    auto truncated = source.next_line(stop.get_token());
    ASSERT_TRUE(truncated.has_value());
    ASSERT_TRUE(truncated->has_value());
    EXPECT_EQ(**truncated, std::string(1024, 'x'));

    auto after = source.next_line(stop.get_token());
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->value_or(""), "after");

    auto end = source.next_line(stop.get_token());
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(end->has_value());
    EXPECT_TRUE(source.at_eof());
}

TEST(FdLineSourceTest, StopsWhileBlocked) {
    Pipe pipe;
    FdLineSource source(pipe.read_fd, true);
    std::stop_source stop;

    std::jthread stopper([&stop] {
        std::this_thread::sleep_for(50ms);
        stop.request_stop();
    });

    auto started = std::chrono::steady_clock::now();
    auto line = source.next_line(stop.get_token());
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(line.has_value());
    EXPECT_FALSE(line->has_value());
    EXPECT_LT(elapsed, 2s);
}

TEST(JournalSourceTest, DefaultCommand) {
    const auto& command = JournalSource::default_command();
    ASSERT_EQ(command.size(), 4u);
    EXPECT_EQ(command[0], "journalctl");
    EXPECT_EQ(command[2], "json");
    EXPECT_EQ(command[3], "-f");
}

TEST(JournalSourceTest, EmptyCommandIsRejected) {
    auto source = JournalSource::spawn({});
    ASSERT_FALSE(source.has_value());
}

TEST(JournalSourceTest, ReadsSubprocessOutput) {
    auto source = JournalSource::spawn(
        {"/bin/sh", "-c", R"(printf '{"MESSAGE":"a"}\n{"MESSAGE":"b"}\n'; sleep 5)"});
    ASSERT_TRUE(source.has_value()) << source.error().message;
    EXPECT_GT((*source)->pid(), 0);
    std::stop_source stop;

    EXPECT_EQ(*(*source)->next_line(stop.get_token()), R"({"MESSAGE":"a"})");
    EXPECT_EQ(*(*source)->next_line(stop.get_token()), R"({"MESSAGE":"b"})");
    // Destruction terminates the still-running subprocess
}

TEST(JournalSourceTest, SubprocessExitBecomesError) {
    auto source = JournalSource::spawn(
        {"/bin/sh", "-c", "echo 'No journal files were found.' >&2; exit 1"});
    ASSERT_TRUE(source.has_value()) << source.error().message;
    std::stop_source stop;

    auto line = (*source)->next_line(stop.get_token());
    ASSERT_FALSE(line.has_value());
    EXPECT_EQ(line.error().kind, ErrorKind::IoFailure);
    EXPECT_NE(line.error().message.find("No journal files were found."), std::string::npos);
    EXPECT_NE(line.error().message.find("exit status 1"), std::string::npos);
}

TEST(JournalSourceTest, MissingExecutableReportsExecFailure) {
    auto source = JournalSource::spawn({"/nonexistent/journalctl"});
    ASSERT_TRUE(source.has_value());
    std::stop_source stop;

    auto line = (*source)->next_line(stop.get_token());
    ASSERT_FALSE(line.has_value());
    EXPECT_NE(line.error().message.find("exit status 127"), std::string::npos);
    EXPECT_NE(line.error().message.find("failed to exec journal reader: /nonexistent/journalctl"),
              std::string::npos);
}
