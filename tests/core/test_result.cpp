#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "backfolio/core/error.hpp"

using namespace backfolio;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result(std::string("success"));
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<double> double_result(3.14);
    EXPECT_DOUBLE_EQ(double_result.value(), 3.14);
}

TEST_F(ResultTest, ErrorCarriesCodeMessageAndComponent) {
    auto error_result =
        make_error<int>(ErrorCode::INVALID_ARGUMENT, "Test error message", "TestComponent");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_STREQ(error_result.error()->what(), "Test error message");
    EXPECT_EQ(error_result.error()->component(), "TestComponent");
    EXPECT_EQ(error_result.error()->to_string(),
              "Error in TestComponent: Test error message (INVALID_ARGUMENT)");
}

TEST_F(ResultTest, ValueOfErrorThrows) {
    auto error_result = make_error<int>(ErrorCode::RUN_CANCELLED, "Cancelled", "Engine");
    EXPECT_THROW(error_result.value(), BacktestError);

    try {
        error_result.value();
        FAIL() << "value() should throw";
    } catch (const BacktestError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RUN_CANCELLED);
    }
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::string> str_result(std::string("test"));
    Result<std::string> moved_str = std::move(str_result);

    EXPECT_TRUE(moved_str.is_ok());
    EXPECT_EQ(moved_str.value(), "test");

    auto moved_error = make_error<std::string>(ErrorCode::DATABASE_ERROR, "down", "Db");
    Result<std::string> target = std::move(moved_error);
    ASSERT_TRUE(target.is_error());
    EXPECT_EQ(target.error()->code(), ErrorCode::DATABASE_ERROR);
}

TEST_F(ResultTest, TakeValueMovesOut) {
    Result<std::vector<int>> result(std::vector<int>{1, 2, 3});
    std::vector<int> taken = result.take_value();
    EXPECT_EQ(taken.size(), 3u);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::INSUFFICIENT_FUNDS, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_EQ(error.error()->code(), ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_THROW(error.value(), BacktestError);
}

TEST_F(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(error_code_to_string(ErrorCode::SETUP_ERROR), "SETUP_ERROR");
    EXPECT_EQ(error_code_to_string(ErrorCode::INVALID_FILL), "INVALID_FILL");
    EXPECT_EQ(error_code_to_string(ErrorCode::POSITION_LIMIT_EXCEEDED), "POSITION_LIMIT_EXCEEDED");
    EXPECT_EQ(error_code_to_string(ErrorCode::JSON_PARSE_ERROR), "JSON_PARSE_ERROR");
}

TEST_F(ResultTest, ErrorCodeFromName) {
    EXPECT_EQ(error_code_from_string("POSITION_LIMIT_EXCEEDED"),
              ErrorCode::POSITION_LIMIT_EXCEEDED);
    EXPECT_EQ(error_code_from_string("INSUFFICIENT_FUNDS"), ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(error_code_from_string("NONE"), ErrorCode::NONE);
    EXPECT_EQ(error_code_from_string("not a code"), ErrorCode::UNKNOWN_ERROR);
}
