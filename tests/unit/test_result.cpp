/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace gelf_relay;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorKind::ParsingFailure, "something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::ParsingFailure);
    EXPECT_EQ(r.error().message, "something went wrong");
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{ErrorKind::IoFailure, "fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{ErrorKind::IoFailure, "fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> failure = Error{ErrorKind::InternalFailure, "fail"};
    EXPECT_THROW((void)failure.value(), std::runtime_error);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{ErrorKind::NoMessage, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().kind, ErrorKind::NoMessage);
    EXPECT_EQ(doubled.error().message, "fail");
}

TEST(ResultTest, MoveOutOfRvalue) {
    Result<std::unique_ptr<int>> r = std::make_unique<int>(7);
    auto owned = *std::move(r);
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, VoidSpecialization) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());

    Result<void> failed = Error{ErrorKind::CompressionFailure, "deflate"};
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().kind, ErrorKind::CompressionFailure);
}

TEST(ErrorTest, DescribeIncludesKind) {
    Error err{ErrorKind::IoFailure, "bind failed"};
    EXPECT_EQ(err.describe(), "[io] bind failed");
    EXPECT_EQ(err.what(), "bind failed");
    EXPECT_EQ(to_string(ErrorKind::InsufficientLogLevel), "insufficient log level");
}
