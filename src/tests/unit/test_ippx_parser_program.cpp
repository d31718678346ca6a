//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_ippx_parser_program.cpp
// Purpose: End-to-end parsing of whole IPPcode24 programs.
// Key invariants: Order numbers are contiguous from 1; the first error stops
//                 the run and no program is produced.
// Ownership/Lifetime: Test owns input buffers and results.
// Links: docs/ippcode24.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "ippx/IO.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace ippx::core;
using namespace ippx::io;

namespace
{
ParseResult<Program> parseText(const std::string &text, const ParserOptions &opts = {})
{
    std::istringstream in(text);
    std::vector<std::string> lines;
    EXPECT_TRUE(readLines(in, lines));
    return Parser::parse(lines, opts, 1);
}
} // namespace

TEST(ParserProgram, DeclareMoveWrite)
{
    auto r = parseText(".IPPcode24\nDEFVAR GF@x\nMOVE GF@x int@42\nWRITE GF@x\n");
    ASSERT_TRUE(r);
    const Program &p = r.value();
    EXPECT_EQ(p.language, "IPPcode24");
    EXPECT_TRUE(p.headerAccepted);
    ASSERT_EQ(p.instructions.size(), 3u);
    EXPECT_EQ(p.instructions[0].op, Opcode::DefVar);
    EXPECT_EQ(p.instructions[1].op, Opcode::Move);
    EXPECT_EQ(p.instructions[2].op, Opcode::Write);
    for (size_t i = 0; i < p.instructions.size(); ++i)
        EXPECT_EQ(p.instructions[i].order, i + 1);

    const Operand &value = p.instructions[1].operands[1];
    EXPECT_EQ(value.kind, OperandKind::Int);
    ASSERT_TRUE(value.intValue.has_value());
    EXPECT_EQ(*value.intValue, 42);
}

TEST(ParserProgram, MissingHeader)
{
    auto r = parseText("DEFVAR GF@x\nWRITE GF@x\n");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::Header);
}

TEST(ParserProgram, ArityFailure)
{
    auto r = parseText(".IPPcode24\nADD GF@x GF@x\n");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::Arity);
}

TEST(ParserProgram, StringEscapesAreDecoded)
{
    auto r = parseText(".IPPcode24\nDEFVAR GF@x\nMOVE GF@x string@ab\\065c\n");
    ASSERT_TRUE(r);
    const Operand &s = r.value().instructions[1].operands[1];
    EXPECT_EQ(s.kind, OperandKind::String);
    EXPECT_EQ(s.text, "abAc");
}

TEST(ParserProgram, UnknownOpcodeIsDistinct)
{
    auto r = parseText(".IPPcode24\nFOO GF@x\n");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::UnknownOpcode);
    EXPECT_FALSE(isOperandSyntaxError(r.error().kind));
}

TEST(ParserProgram, UndeclaredUseBeforeDefVar)
{
    auto r = parseText(".IPPcode24\nWRITE GF@y\nDEFVAR GF@y\n");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::UndeclaredVariable);
    EXPECT_EQ(r.error().diag.loc.line, 2u);
}

TEST(ParserProgram, FramesAreIndependent)
{
    auto r = parseText(".IPPcode24\nDEFVAR GF@x\nWRITE LF@x\n");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::UndeclaredVariable);

    EXPECT_TRUE(parseText(".IPPcode24\nDEFVAR GF@x\nDEFVAR LF@x\nWRITE LF@x\nWRITE GF@x\n"));
}

TEST(ParserProgram, OrderSkipsCommentsAndBlankLines)
{
    auto r = parseText("# prologue\n.IPPcode24\n\nCREATEFRAME # frame\n# between\n\nPUSHFRAME\nPOPFRAME\n");
    ASSERT_TRUE(r);
    const auto &instrs = r.value().instructions;
    ASSERT_EQ(instrs.size(), 3u);
    EXPECT_EQ(instrs[0].order, 1u);
    EXPECT_EQ(instrs[0].loc.line, 4u);
    EXPECT_EQ(instrs[1].order, 2u);
    EXPECT_EQ(instrs[1].loc.line, 7u);
    EXPECT_EQ(instrs[2].order, 3u);
}

TEST(ParserProgram, FirstErrorWins)
{
    auto r = parseText(".IPPcode24\nMOVE GF@x\nFOO\nWRITE bool@maybe\n");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::Arity);
    EXPECT_EQ(r.error().diag.loc.line, 2u);
}

TEST(ParserProgram, HeaderCheckedBeforeInstructions)
{
    auto r = parseText(".IPPcode23\nFOO\n");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::Header);
}

TEST(ParserProgram, EmptyProgramBenignByDefault)
{
    auto r = parseText(".IPPcode24\n# nothing here\n");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().headerAccepted);
    EXPECT_TRUE(r.value().instructions.empty());
}

TEST(ParserProgram, EmptyProgramRejectedWhenConfigured)
{
    ParserOptions opts;
    opts.allowEmptyProgram = false;
    auto r = parseText(".IPPcode24\n", opts);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::EmptyProgram);
    EXPECT_TRUE(parseText(".IPPcode24\nBREAK\n", opts));
}

TEST(ParserProgram, StateDoesNotLeakBetweenRuns)
{
    ASSERT_TRUE(parseText(".IPPcode24\nDEFVAR GF@x\n"));
    auto r = parseText(".IPPcode24\nWRITE GF@x\n");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::UndeclaredVariable);
}

TEST(ParserProgram, ControlFlowProgram)
{
    auto r = parseText(".IPPcode24\n"
                       "DEFVAR GF@counter\n"
                       "MOVE GF@counter int@0\n"
                       "LABEL loop\n"
                       "ADD GF@counter GF@counter int@1\n"
                       "JUMPIFNEQ loop GF@counter int@0x0A\n"
                       "CALL done\n"
                       "LABEL done\n"
                       "READ GF@counter int\n"
                       "TYPE GF@counter nil@nil\n"
                       "EXIT int@0\n");
    ASSERT_TRUE(r);
    const auto &instrs = r.value().instructions;
    ASSERT_EQ(instrs.size(), 10u);
    EXPECT_EQ(instrs[4].operands[0].kind, OperandKind::Label);
    EXPECT_EQ(instrs[4].operands[2].intValue.value_or(0), 10);
    EXPECT_EQ(instrs[7].operands[1].kind, OperandKind::Type);
    EXPECT_EQ(instrs[8].operands[1].kind, OperandKind::Nil);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
