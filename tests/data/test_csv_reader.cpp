#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "cross_stats/data/csv_reader.hpp"

using namespace cross_stats;

class CsvReaderTest : public ::testing::Test {
protected:
    std::vector<RawRecord> read(const std::string& text, char delimiter = ',') {
        std::istringstream input(text);
        CsvReader reader(delimiter);
        auto result = reader.read_stream(input);
        EXPECT_TRUE(result.is_ok());
        return result.value();
    }
};

TEST_F(CsvReaderTest, SplitsPlainRecords) {
    auto records = read("a,b,c\n1,2,3\n");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], (RawRecord{"a", "b", "c"}));
    EXPECT_EQ(records[1], (RawRecord{"1", "2", "3"}));
}

TEST_F(CsvReaderTest, LastLineWithoutNewline) {
    auto records = read("a,b\n1,2");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1], (RawRecord{"1", "2"}));
}

TEST_F(CsvReaderTest, KeepsEmptyFields) {
    auto records = read("A,R1,1.0,\n,,\n");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], (RawRecord{"A", "R1", "1.0", ""}));
    EXPECT_EQ(records[1], (RawRecord{"", "", ""}));
}

TEST_F(CsvReaderTest, QuotedFieldsMayContainDelimiterQuotesAndNewlines) {
    auto records = read("\"Congo, Rep.\",\"Sub-Saharan \"\"Africa\"\"\",\"line\nbreak\"\n");

    ASSERT_EQ(records.size(), 1u);
    ASSERT_EQ(records[0].size(), 3u);
    EXPECT_EQ(records[0][0], "Congo, Rep.");
    EXPECT_EQ(records[0][1], "Sub-Saharan \"Africa\"");
    EXPECT_EQ(records[0][2], "line\nbreak");
}

TEST_F(CsvReaderTest, HandlesCrLfLineEndings) {
    auto records = read("a,b\r\n1,2\r\n");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0], (RawRecord{"a", "b"}));
    EXPECT_EQ(records[1], (RawRecord{"1", "2"}));
}

TEST_F(CsvReaderTest, SkipsUtf8ByteOrderMark) {
    auto records = read("\xEF\xBB\xBF" "Country name,Regional indicator\n");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0][0], "Country name");
}

TEST_F(CsvReaderTest, BlankLineYieldsEmptyRecord) {
    auto records = read("a,b\n\n1,2\n");

    ASSERT_EQ(records.size(), 3u);
    EXPECT_TRUE(records[1].empty());
}

TEST_F(CsvReaderTest, CustomDelimiter) {
    auto records = read("a;b,c\n", ';');

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (RawRecord{"a", "b,c"}));
}

TEST_F(CsvReaderTest, EmptyInputHasNoRecords) {
    EXPECT_TRUE(read("").empty());
}

TEST_F(CsvReaderTest, MissingFileIsFileNotFound) {
    CsvReader reader;
    auto result = reader.read_file("/nonexistent/cross_stats/input.csv");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(CsvReaderTest, ReadsFile) {
    auto path = std::filesystem::temp_directory_path() / "cross_stats_csv_reader_test.csv";
    {
        std::ofstream file(path);
        file << "h1,h2\nv1,v2\n";
    }

    CsvReader reader;
    auto result = reader.read_file(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[1], (RawRecord{"v1", "v2"}));
}
