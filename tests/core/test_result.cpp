#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <string>
#include "cross_stats/core/error.hpp"

using namespace cross_stats;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<size_t> offset_result(size_t{3});
    EXPECT_TRUE(offset_result.is_ok());
    EXPECT_FALSE(offset_result.is_error());
    EXPECT_EQ(offset_result.value(), 3u);
    EXPECT_EQ(offset_result.error(), nullptr);

    Result<std::string> string_result(std::string("Ladder score"));
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "Ladder score");
}

TEST_F(ResultTest, ErrorCarriesCodeAndComponent) {
    auto error_result =
        make_error<size_t>(ErrorCode::COLUMN_NOT_FOUND, "Unknown column: 'x'", "ColumnIndex");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::COLUMN_NOT_FOUND);
    EXPECT_STREQ(error_result.error()->what(), "Unknown column: 'x'");
    EXPECT_EQ(error_result.error()->component(), "ColumnIndex");
    EXPECT_EQ(error_result.error()->to_string(),
              "Error in ColumnIndex: Unknown column: 'x' (COLUMN_NOT_FOUND)");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<double>(ErrorCode::ENTITY_NOT_FOUND, "missing", "Test");
    EXPECT_THROW(error_result.value(), AnalysisError);

    try {
        error_result.value();
        FAIL() << "Expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ENTITY_NOT_FOUND);
    }
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::map<std::string, int>> map_result(std::map<std::string, int>{{"R1", 2}});
    Result<std::map<std::string, int>> moved = std::move(map_result);
    ASSERT_TRUE(moved.is_ok());
    EXPECT_EQ(moved.value().at("R1"), 2);

    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> ptr_result(std::move(ptr));
    Result<std::unique_ptr<int>> moved_ptr = std::move(ptr_result);
    EXPECT_TRUE(moved_ptr.is_ok());
    EXPECT_EQ(*moved_ptr.value(), 42);
}

TEST_F(ResultTest, ForwardErrorKeepsCodeAndMessage) {
    auto original = make_error<size_t>(ErrorCode::COLUMN_NOT_FOUND, "Unknown column", "ColumnIndex");
    auto forwarded = forward_error<std::string>(original, "AnalysisEngine");

    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::COLUMN_NOT_FOUND);
    EXPECT_STREQ(forwarded.error()->what(), "Unknown column");
    EXPECT_EQ(forwarded.error()->component(), "AnalysisEngine");
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::FILE_NOT_FOUND, "No such file", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_THROW(error.value(), AnalysisError);
}
