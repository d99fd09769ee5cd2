#include <gtest/gtest.h>

#include "es/es.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(es::Version::major, 0);
    EXPECT_EQ(es::Version::minor, 3);
    EXPECT_EQ(es::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(es::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = es::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = es::Result<int>::err(es::Error(404, "not found"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ValueOr) {
    auto ok = es::Result<int>::ok(10);
    auto err = es::Result<int>::err(es::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
    EXPECT_EQ(err.error().code, -1);
}

TEST(ResultVoidTest, OkAndError) {
    auto ok = es::Result<void>::ok();
    EXPECT_TRUE(static_cast<bool>(ok));

    auto err = es::Result<void>::err(es::Error("void error"));
    EXPECT_FALSE(static_cast<bool>(err));
    EXPECT_EQ(err.error().message, "void error");
}

TEST(ResultRefTest, RefersToOriginal) {
    int target = 1;
    auto result = es::Result<int&>::ok(target);
    ASSERT_TRUE(result.hasValue());
    result.value() = 5;
    EXPECT_EQ(target, 5);
    EXPECT_EQ(&result.value(), &target);
}

TEST(ResultRefTest, ErrorHoldsNoReference) {
    auto result = es::Result<const int&>::err(es::Error("absent"));
    EXPECT_TRUE(result.hasError());
    EXPECT_FALSE(static_cast<bool>(result));
}
