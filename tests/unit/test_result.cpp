/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the Error taxonomy.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace cloudlet;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_TRUE(r.error().is(ErrorKind::Generic));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error::blob_not_found("abc");
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_TRUE(doubled.error().is(ErrorKind::BlobNotFound));
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 20;
    auto chained = r.and_then([](int v) -> Result<int> { return v + 1; })
                    .and_then([](int v) -> Result<int> {
                        if (v > 20) return Error::validation_failed("v", "too large");
                        return v;
                    });
    ASSERT_FALSE(chained.has_value());
    EXPECT_TRUE(chained.error().is(ErrorKind::ValidationFailed));
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error::queue_operation_failed("orders", "disk full");
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().queue_name, "orders");
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ErrorTest, QuotaErrorCarriesLimit) {
    auto e = Error::queue_quota_exceeded("orders", 1024, "message of 2048 bytes");
    EXPECT_TRUE(e.is(ErrorKind::QueueQuotaExceeded));
    EXPECT_EQ(e.queue_name, "orders");
    EXPECT_EQ(e.max_bytes, 1024u);
    EXPECT_NE(e.message.find("2048"), std::string::npos);
}

TEST(ErrorTest, ExecutionErrorCarriesFunctionAndBlob) {
    auto e = Error::function_execution_failed("resize", "blob-1", "exit code 2");
    EXPECT_TRUE(e.is(ErrorKind::FunctionExecutionFailed));
    EXPECT_EQ(e.function_name, "resize");
    EXPECT_EQ(e.blob_id, "blob-1");
}

TEST(ErrorTest, ValidationErrorsAreCollectedPerField) {
    FieldErrors errors;
    errors["name"].push_back("must not be empty");
    errors["name"].push_back("too long");
    errors["queue"].push_back("bad character");

    auto e = Error::validation_failed(errors);
    EXPECT_TRUE(e.is(ErrorKind::ValidationFailed));
    EXPECT_EQ(e.field_errors.size(), 2u);
    EXPECT_EQ(e.field_errors.at("name").size(), 2u);
    EXPECT_NE(e.message.find("queue: bad character"), std::string::npos);
}

TEST(ErrorTest, KindNames) {
    EXPECT_EQ(to_string(ErrorKind::BlobNotFound), "blob_not_found");
    EXPECT_EQ(to_string(ErrorKind::QueueQuotaExceeded), "queue_quota_exceeded");
}
