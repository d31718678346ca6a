// File: tests/unit/test_ippx_parser_util.cpp
// Purpose: Cover the lexical helpers: trimming, tokenising, identifiers and integer literals.
// Key invariants: Integer grammar accepts decimal, 0o-octal and 0x-hex with an optional sign.
// Ownership/Lifetime: Test owns all buffers locally.
// Links: docs/ippcode24.md#lexical-structure

#include <gtest/gtest.h>

#include "ippx/io/ParserUtil.hpp"

#include <limits>
#include <sstream>

using namespace ippx::io;

TEST(ParserUtil, TrimStripsSurroundingWhitespace)
{
    EXPECT_EQ(trim("  MOVE GF@x int@1 \t\r"), "MOVE GF@x int@1");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(ParserUtil, SplitTokensRecordsColumns)
{
    auto tokens = splitTokens("MOVE  GF@x\tint@1", 3);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].text, "MOVE");
    EXPECT_EQ(tokens[0].column, 3u);
    EXPECT_EQ(tokens[1].text, "GF@x");
    EXPECT_EQ(tokens[1].column, 9u);
    EXPECT_EQ(tokens[2].text, "int@1");
    EXPECT_EQ(tokens[2].column, 14u);
}

TEST(ParserUtil, IdentifierGrammar)
{
    EXPECT_TRUE(isIdentifier("x"));
    EXPECT_TRUE(isIdentifier("_tmp"));
    EXPECT_TRUE(isIdentifier("-a$b&c%d*e!f?g"));
    EXPECT_TRUE(isIdentifier("counter42"));
    EXPECT_FALSE(isIdentifier(""));
    EXPECT_FALSE(isIdentifier("1abc"));
    EXPECT_FALSE(isIdentifier("a@b"));
    EXPECT_FALSE(isIdentifier("a.b"));
    EXPECT_FALSE(isIdentifier("a#b"));
}

TEST(ParserUtil, IntegerLiteralForms)
{
    long long v = 0;
    ASSERT_TRUE(parseIntegerLiteral("42", v));
    EXPECT_EQ(v, 42);
    ASSERT_TRUE(parseIntegerLiteral("-17", v));
    EXPECT_EQ(v, -17);
    ASSERT_TRUE(parseIntegerLiteral("+8", v));
    EXPECT_EQ(v, 8);
    ASSERT_TRUE(parseIntegerLiteral("0o17", v));
    EXPECT_EQ(v, 15);
    ASSERT_TRUE(parseIntegerLiteral("0O777", v));
    EXPECT_EQ(v, 511);
    ASSERT_TRUE(parseIntegerLiteral("0x1F", v));
    EXPECT_EQ(v, 31);
    ASSERT_TRUE(parseIntegerLiteral("-0XfF", v));
    EXPECT_EQ(v, -255);
    ASSERT_TRUE(parseIntegerLiteral("017", v));
    EXPECT_EQ(v, 17);
}

TEST(ParserUtil, IntegerLiteralRejectsMalformedText)
{
    long long v = 0;
    EXPECT_FALSE(parseIntegerLiteral("", v));
    EXPECT_FALSE(parseIntegerLiteral("-", v));
    EXPECT_FALSE(parseIntegerLiteral("0x", v));
    EXPECT_FALSE(parseIntegerLiteral("0o8", v));
    EXPECT_FALSE(parseIntegerLiteral("0xG1", v));
    EXPECT_FALSE(parseIntegerLiteral("12a", v));
    EXPECT_FALSE(parseIntegerLiteral("1.5", v));
    EXPECT_FALSE(parseIntegerLiteral("0b101", v));
}

TEST(ParserUtil, IntegerLiteralRange)
{
    long long v = 0;
    ASSERT_TRUE(parseIntegerLiteral("9223372036854775807", v));
    EXPECT_EQ(v, std::numeric_limits<long long>::max());
    ASSERT_TRUE(parseIntegerLiteral("-9223372036854775808", v));
    EXPECT_EQ(v, std::numeric_limits<long long>::min());
    EXPECT_FALSE(parseIntegerLiteral("9223372036854775808", v));
    EXPECT_FALSE(parseIntegerLiteral("0x10000000000000000", v));
}

TEST(ParserUtil, ReadLinesKeepsEveryPhysicalLine)
{
    std::istringstream in("a\n\nb # c\n");
    std::vector<std::string> lines;
    ASSERT_TRUE(readLines(in, lines));
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(lines[2], "b # c");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
