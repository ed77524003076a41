/**
 * @file test_shared_config.cpp
 * @brief Unit tests for the hot-reload hand-off and field-wise merge.
 */

#include "core/shared_config.hpp"
#include "telemetry/log_sinks.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace gelf_relay;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

WatchedConfig base_config() {
    WatchedConfig config;
    config.graylog_addr = "graylog:12201";
    config.compression = gelf::Compression::None;
    return config;
}

}  // namespace

TEST(SharedConfigTest, StartsUnchanged) {
    SharedConfig shared(base_config());
    EXPECT_FALSE(shared.changed());
    EXPECT_FALSE(shared.take_if_changed().has_value());
    EXPECT_EQ(shared.snapshot(), base_config());
}

TEST(SharedConfigTest, PublishRaisesFlagOnce) {
    SharedConfig shared(base_config());

    auto update = base_config();
    update.compression = gelf::Compression::Gzip;
    shared.publish(update);
    EXPECT_TRUE(shared.changed());

    auto taken = shared.take_if_changed();
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->compression, gelf::Compression::Gzip);

    EXPECT_FALSE(shared.changed());
    EXPECT_FALSE(shared.take_if_changed().has_value());
}

TEST(SharedConfigTest, LatestPublishWins) {
    SharedConfig shared(base_config());

    auto first = base_config();
    first.team = "a";
    auto second = base_config();
    second.team = "b";
    shared.publish(first);
    shared.publish(second);

    auto taken = shared.take_if_changed();
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->team, "b");
}

TEST(SharedConfigTest, PublishFromAnotherThread) {
    SharedConfig shared(base_config());

    std::thread writer([&] {
        auto update = base_config();
        update.graylog_addr = "other:12201";
        shared.publish(update);
    });
    writer.join();

    auto taken = shared.take_if_changed();
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->graylog_addr, "other:12201");
}

TEST(MergeWatchedTest, CopiesOnlyDifferingFields) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));

    auto current = base_config();
    auto update = base_config();
    update.compression = gelf::Compression::Gzip;
    update.log_level_message = gelf::MessageLevel::Warning;

    EXPECT_EQ(merge_watched(current, update, logger), 2u);
    EXPECT_EQ(current, update);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("compression: none -> gzip"), std::string::npos);
    EXPECT_NE(lines[1].find("log_level_message: <unset> -> warning"), std::string::npos);
}

TEST(MergeWatchedTest, IdenticalConfigIsQuiet) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));

    auto current = base_config();
    EXPECT_EQ(merge_watched(current, base_config(), logger), 0u);
    EXPECT_TRUE(lines.empty());
}

TEST(MergeWatchedTest, ClearsOptionalFields) {
    Logger logger(std::make_unique<NullSink>());

    auto current = base_config();
    current.service = "edge";
    EXPECT_EQ(merge_watched(current, base_config(), logger), 1u);
    EXPECT_FALSE(current.service.has_value());
}
