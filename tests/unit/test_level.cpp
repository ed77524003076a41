/**
 * @file test_level.cpp
 * @brief Unit tests for system and message severity levels.
 */

#include "gelf/level.hpp"

#include <gtest/gtest.h>

using namespace gelf_relay::gelf;

TEST(SystemLevelTest, CodesFollowSyslog) {
    EXPECT_EQ(to_code(SystemLevel::Emergency), 0);
    EXPECT_EQ(to_code(SystemLevel::Error), 3);
    EXPECT_EQ(to_code(SystemLevel::Debug), 7);
    EXPECT_EQ(system_level_from_code(4), SystemLevel::Warning);
}

TEST(SystemLevelTest, OutOfRangeCodeClampsToDebug) {
    EXPECT_EQ(system_level_from_code(8), SystemLevel::Debug);
    EXPECT_EQ(system_level_from_code(255), SystemLevel::Debug);
}

TEST(SystemLevelTest, LowerCodeIsMoreSevere) {
    EXPECT_LT(SystemLevel::Critical, SystemLevel::Warning);
    EXPECT_GT(SystemLevel::Notice, SystemLevel::Error);
}

TEST(SystemLevelTest, ParseNames) {
    EXPECT_EQ(parse_system_level("critical"), SystemLevel::Critical);
    EXPECT_EQ(parse_system_level("informational"), SystemLevel::Informational);
    EXPECT_EQ(parse_system_level("info"), SystemLevel::Informational);
    EXPECT_FALSE(parse_system_level("fatal").has_value());
    EXPECT_EQ(to_string(SystemLevel::Notice), "notice");
}

TEST(MessageLevelTest, ParseIsStrict) {
    EXPECT_EQ(parse_message_level("panic"), MessageLevel::Panic);
    EXPECT_EQ(parse_message_level("warning"), MessageLevel::Warning);
    EXPECT_FALSE(parse_message_level("WARNING").has_value());
    EXPECT_FALSE(parse_message_level("warn").has_value());
}

TEST(MessageLevelTest, WordMappingIsLenient) {
    EXPECT_EQ(message_level_from_word("ERROR"), MessageLevel::Error);
    EXPECT_EQ(message_level_from_word("Info"), MessageLevel::Info);
    EXPECT_EQ(message_level_from_word("trace"), MessageLevel::Debug);
    EXPECT_EQ(message_level_from_word(""), MessageLevel::Debug);
}

TEST(MessageLevelTest, FatalIsMostSevere) {
    EXPECT_LT(MessageLevel::Fatal, MessageLevel::Panic);
    EXPECT_LT(MessageLevel::Error, MessageLevel::Warning);
    EXPECT_LT(MessageLevel::Info, MessageLevel::Debug);
}
