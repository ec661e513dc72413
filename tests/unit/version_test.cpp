#include <gtest/gtest.h>

#include <string>

#include "abp/abp.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(abp::Version::major, 0);
    EXPECT_EQ(abp::Version::minor, 3);
    EXPECT_EQ(abp::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(abp::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = abp::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = abp::Result<int>::err(abp::Error("something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "something failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = abp::Result<std::string>::err(abp::Error(7, "bad step"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 7);
    EXPECT_EQ(result.error().message, "bad step");
}

TEST(ResultTest, ValueOr) {
    auto ok = abp::Result<int>::ok(10);
    auto err = abp::Result<int>::err(abp::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, MoveOutValue) {
    auto result = abp::Result<std::string>::ok("wander");
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "wander");
}

TEST(ResultTest, BoolConversion) {
    auto ok = abp::Result<int>::ok(1);
    auto err = abp::Result<int>::err(abp::Error("fail"));
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultVoidTest, Ok) {
    auto result = abp::Result<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = abp::Result<void>::err(abp::Error("void error"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}
