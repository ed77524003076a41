/**
 * @file test_logger.cpp
 * @brief Unit tests for the JSON-lines logger and its sinks.
 */

#include "core/logger.hpp"
#include "telemetry/log_sinks.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
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

}  // namespace

TEST(LoggerTest, EmitsOneJsonObjectPerLine) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Debug);

    logger.info("relay started");

    ASSERT_EQ(lines.size(), 1u);
    auto doc = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(doc["level"], "info");
    EXPECT_EQ(doc["msg"], "relay started");
    EXPECT_TRUE(doc["ts"].get<std::string>().ends_with("Z"));
}

TEST(LoggerTest, EscapesRecordText) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));

    logger.warn(R"(Parsing error, message: {"MESSAGE":"a\tb"})");

    ASSERT_EQ(lines.size(), 1u);
    auto doc = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(doc["msg"], R"(Parsing error, message: {"MESSAGE":"a\tb"})");
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("shown");
    EXPECT_EQ(lines.size(), 2u);

    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.debug("now shown");
    EXPECT_EQ(lines.size(), 3u);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(JsonFileSinkTest, AppendsAndCreatesDirectories) {
    auto dir = std::filesystem::temp_directory_path() / "gelf_relay_test_sink" / "nested";
    std::filesystem::remove_all(dir.parent_path());
    auto path = dir / "relay.log";

    {
        Logger logger(std::make_unique<JsonFileSink>(path));
        logger.info("first");
        logger.error("second");
        logger.flush();
    }

    std::ifstream in(path);
    std::string line;
    std::vector<std::string> read;
    while (std::getline(in, line)) read.push_back(line);

    ASSERT_EQ(read.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(read[1])["level"], "error");

    std::filesystem::remove_all(dir.parent_path());
}
