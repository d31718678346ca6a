//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_ippx_line_preprocessor.cpp
// Purpose: Verify comment stripping, blank-line removal and header validation.
// Key invariants: Physical line numbers survive preprocessing.
// Ownership/Lifetime: Test owns all buffers.
// Links: docs/ippcode24.md#lexical-structure
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "ippx/io/LinePreprocessor.hpp"
#include "ippx/io/ParserUtil.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace ippx::core;
using namespace ippx::io;

namespace
{
std::vector<std::string> linesOf(const std::string &text)
{
    std::istringstream in(text);
    std::vector<std::string> lines;
    EXPECT_TRUE(readLines(in, lines));
    return lines;
}
} // namespace

TEST(LinePreprocessor, StripsCommentsAndBlankLines)
{
    ParserOptions opts;
    auto src = preprocess(linesOf("# leading comment\n"
                                  "\n"
                                  ".IPPcode24 # header comment\n"
                                  "   \n"
                                  "  WRITE int@1   # trailing\n"
                                  "#CREATEFRAME\n"
                                  "BREAK\n"),
                          opts);
    ASSERT_TRUE(src);
    EXPECT_TRUE(src.value().headerOk);
    ASSERT_EQ(src.value().lines.size(), 2u);

    const LogicalLine &write = src.value().lines[0];
    EXPECT_EQ(write.text, "WRITE int@1");
    EXPECT_EQ(write.lineNo, 5u);
    EXPECT_EQ(write.column, 3u);

    const LogicalLine &brk = src.value().lines[1];
    EXPECT_EQ(brk.text, "BREAK");
    EXPECT_EQ(brk.lineNo, 7u);
    EXPECT_EQ(brk.column, 1u);
}

TEST(LinePreprocessor, HashInsideStringStartsComment)
{
    ParserOptions opts;
    auto src = preprocess(linesOf(".IPPcode24\nWRITE string@a#b\n"), opts);
    ASSERT_TRUE(src);
    ASSERT_EQ(src.value().lines.size(), 1u);
    EXPECT_EQ(src.value().lines[0].text, "WRITE string@a");
}

TEST(LinePreprocessor, AcceptsBomAndCrlf)
{
    ParserOptions opts;
    auto src = preprocess(linesOf("\xEF\xBB\xBF.IPPcode24\r\nBREAK\r\n"), opts);
    ASSERT_TRUE(src);
    ASSERT_EQ(src.value().lines.size(), 1u);
    EXPECT_EQ(src.value().lines[0].text, "BREAK");
}

TEST(LinePreprocessor, HeaderOnlyYieldsNoLines)
{
    ParserOptions opts;
    auto src = preprocess(linesOf(".IPPcode24\n# nothing else\n"), opts);
    ASSERT_TRUE(src);
    EXPECT_TRUE(src.value().headerOk);
    EXPECT_TRUE(src.value().lines.empty());
}

TEST(LinePreprocessor, RejectsWrongHeader)
{
    ParserOptions opts;
    for (const char *text : {".ippcode24\nBREAK\n", ".IPPcode23\n", "BREAK\n.IPPcode24\n", ".IPPcode24 extra\n"})
    {
        auto src = preprocess(linesOf(text), opts);
        ASSERT_FALSE(src) << text;
        EXPECT_EQ(src.error().kind, ErrorKind::Header) << text;
    }
}

TEST(LinePreprocessor, WrongHeaderReportsLine)
{
    ParserOptions opts;
    auto src = preprocess(linesOf("# c\n\n  .IPP\n"), opts, 3);
    ASSERT_FALSE(src);
    const auto &diag = src.error().diag;
    EXPECT_EQ(diag.loc.file_id, 3u);
    EXPECT_EQ(diag.loc.line, 3u);
    EXPECT_EQ(diag.loc.column, 3u);
    EXPECT_EQ(diag.message, "E_HEADER: expected header '.IPPcode24', found '.IPP'");
}

TEST(LinePreprocessor, MissingHeader)
{
    ParserOptions opts;
    for (const char *text : {"", "\n\n", "# only a comment\n"})
    {
        auto src = preprocess(linesOf(text), opts);
        ASSERT_FALSE(src);
        EXPECT_EQ(src.error().kind, ErrorKind::Header);
        EXPECT_NE(src.error().diag.message.find("missing header"), std::string::npos);
    }
}

TEST(LinePreprocessor, HeaderFollowsConfiguredLanguage)
{
    ParserOptions opts;
    opts.language = "IPPcode25";
    EXPECT_TRUE(preprocess(linesOf(".IPPcode25\n"), opts));
    EXPECT_FALSE(preprocess(linesOf(".IPPcode24\n"), opts));
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
