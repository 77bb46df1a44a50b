/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace hydramesh;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().code, ErrorCode::Internal);
}

TEST(ResultTest, ErrorCarriesCode) {
    Result<int> r = Error{ErrorCode::NoWorkers, "no workers available"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NoWorkers);
    EXPECT_EQ(r.error().what(), "no workers available");
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnErrorKeepsCode) {
    Result<int> r = Error{ErrorCode::Malformed, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
    EXPECT_EQ(doubled.error().code, ErrorCode::Malformed);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 10;
    auto halved = r.and_then([](int v) -> Result<int> {
        if (v % 2 != 0) return Error{"odd"};
        return v / 2;
    });
    ASSERT_TRUE(halved.has_value());
    EXPECT_EQ(*halved, 5);

    auto again = halved.and_then([](int v) -> Result<int> {
        if (v % 2 != 0) return Error{"odd"};
        return v / 2;
    });
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().message, "odd");
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<std::string>(ErrorCode::Capacity, "full");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Capacity);
}

TEST(ResultVoidTest, SuccessAndError) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());

    Result<void> failed = Error{ErrorCode::WorkerBusy, "busy"};
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::WorkerBusy);
}

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(to_string(ErrorCode::Malformed), "malformed");
    EXPECT_EQ(to_string(ErrorCode::NoWorkers), "no_workers");
    EXPECT_EQ(to_string(ErrorCode::TaskTimeout), "task_timeout");
    EXPECT_EQ(to_string(ErrorCode::ReassemblyTimeout), "reassembly_timeout");
}
