/**
 * @file test_input_reader.cpp
 * @brief Unit tests for line-oriented UVCI input
 */

#include <gtest/gtest.h>
#include <uvci/common/exceptions.h>
#include <uvci/input_reader.h>
#include <sstream>

using namespace uvci;

TEST(InputReaderTest, KeepsSourceLineNumbersAcrossBlankLines) {
    std::istringstream in(
        "URN:UVCI:01:SE:EHM/V12916227TFJJ#Q\n"
        "\n"
        "   \n"
        "  URN:UVCI:01:SE:EHM/C878/123456789ABC#B  \r\n"
        "\n"
        "garbage\n");

    auto lines = readInputLines(in);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].lineNumber, 1u);
    EXPECT_EQ(lines[0].text, "URN:UVCI:01:SE:EHM/V12916227TFJJ#Q");
    EXPECT_EQ(lines[1].lineNumber, 4u);
    EXPECT_EQ(lines[1].text, "URN:UVCI:01:SE:EHM/C878/123456789ABC#B");
    EXPECT_EQ(lines[2].lineNumber, 6u);
    EXPECT_EQ(lines[2].text, "garbage");
}

TEST(InputReaderTest, LastLineWithoutNewline) {
    std::istringstream in("\nA");
    auto lines = readInputLines(in);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].lineNumber, 2u);
}

TEST(InputReaderTest, EmptyInput) {
    std::istringstream in("");
    EXPECT_TRUE(readInputLines(in).empty());
}

TEST(InputReaderTest, MissingFileThrows) {
    EXPECT_THROW(readInputFile("/nonexistent/uvcis.txt"), common::IoException);
}
