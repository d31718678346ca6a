// File: tests/unit/test_ippx_string_escape.cpp
// Purpose: Ensure string constants decode \DDD escapes and reject malformed ones.
// Key invariants: Each \DDD becomes the character with that decimal code.
// Ownership/Lifetime: Test owns all buffers locally.
// Links: docs/ippcode24.md#string-literals

#include <gtest/gtest.h>

#include "ippx/io/StringEscape.hpp"

#include <string>

using namespace ippx::io;

TEST(StringEscape, DecodesDecimalEscapes)
{
    std::string out;
    ASSERT_TRUE(decodeEscapedString("ab\\065c", out));
    EXPECT_EQ(out, "abAc");

    ASSERT_TRUE(decodeEscapedString("a\\032b\\035c\\092", out));
    EXPECT_EQ(out, "a b#c\\");

    ASSERT_TRUE(decodeEscapedString("\\010", out));
    EXPECT_EQ(out, "\n");
}

TEST(StringEscape, LeavesPlainTextAlone)
{
    std::string out;
    ASSERT_TRUE(decodeEscapedString("", out));
    EXPECT_TRUE(out.empty());
    ASSERT_TRUE(decodeEscapedString("x<y&z@w", out));
    EXPECT_EQ(out, "x<y&z@w");
}

TEST(StringEscape, EncodesHighCodesAsUtf8)
{
    std::string out;
    ASSERT_TRUE(decodeEscapedString("\\233", out));
    EXPECT_EQ(out, "\xC3\xA9");
    ASSERT_TRUE(decodeEscapedString("\\999", out));
    EXPECT_EQ(out, "\xCF\xA7");
}

TEST(StringEscape, RejectsLoneBackslash)
{
    std::string out;
    std::string err;
    EXPECT_FALSE(decodeEscapedString("abc\\", out, &err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(decodeEscapedString("\\12", out));
    EXPECT_FALSE(decodeEscapedString("\\12a", out));
    EXPECT_FALSE(decodeEscapedString("\\n", out));
    EXPECT_FALSE(decodeEscapedString("\\x41", out));
}

TEST(StringEscape, RejectsControlCharactersOutsideXml)
{
    std::string out;
    std::string err;
    EXPECT_FALSE(decodeEscapedString("a\\000b", out, &err));
    EXPECT_NE(err.find("\\000"), std::string::npos);
    for (const char *text : {"a\\001b", "\\008", "\\011", "\\012", "\\014", "\\031"})
        EXPECT_FALSE(decodeEscapedString(text, out)) << text;
}

TEST(StringEscape, AcceptsTabLineFeedAndCarriageReturn)
{
    std::string out;
    ASSERT_TRUE(decodeEscapedString("a\\009b\\010c\\013d\\032", out));
    EXPECT_EQ(out, "a\tb\nc\rd ");
}

TEST(StringEscape, EncodesCarriageReturnAsReference)
{
    EXPECT_EQ(encodeXmlText("a\rb"), "a&#13;b");
    EXPECT_EQ(encodeXmlText("a\tb\nc"), "a\tb\nc");
}

TEST(StringEscape, EncodesXmlMarkup)
{
    EXPECT_EQ(encodeXmlText("a<b>&\"c'"), "a&lt;b&gt;&amp;&quot;c&apos;");
    EXPECT_EQ(encodeXmlText("plain"), "plain");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
