#include "docsort/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using docsort::Err;
using docsort::Error;
using docsort::ErrorCode;
using docsort::Ok;
using docsort::Result;

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Err<int>(ErrorCode::InvalidArgument, "value must be positive");
    }
    return Ok(value);
}

Result<void> check(bool ok) {
    if (!ok) {
        return Err<void>(ErrorCode::Conflict, "busy");
    }
    return Ok();
}

} // namespace

TEST(ResultTest, OkCarriesValue) {
    auto result = parse_positive(7);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 7);
}

TEST(ResultTest, ErrorCarriesCodeAndMessage) {
    auto result = parse_positive(-1);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message, "value must be positive");
    EXPECT_EQ(result.value_or(42), 42);
}

TEST(ResultTest, VoidResult) {
    EXPECT_TRUE(check(true).is_ok());
    auto failed = check(false);
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::Conflict);
}

TEST(ResultTest, SameValueAndErrorTypeIsUnambiguous) {
    Result<std::string, std::string> ok(docsort::OkValue<std::string>("value"));
    Result<std::string, std::string> err(docsort::ErrValue<std::string>("oops"));
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "oops");
}

TEST(ResultTest, ErrorCodeNames) {
    EXPECT_STREQ(docsort::to_string(ErrorCode::NotFound), "not_found");
    EXPECT_STREQ(docsort::to_string(ErrorCode::Config), "config");
    EXPECT_STREQ(docsort::to_string(ErrorCode::IoError), "io_error");
}
