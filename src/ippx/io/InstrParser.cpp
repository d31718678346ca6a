// File: src/ippx/io/InstrParser.cpp
// Purpose: Implements parsing of IPPcode24 instruction lines (GNU GPL v3; see LICENSE).
// Key invariants: Order numbers are assigned only to instructions that fully validate.
// Ownership/Lifetime: Instructions are returned by value to the program assembler.
// Links: docs/ippcode24.md#instructions

#include "ippx/io/InstrParser.hpp"

#include "ippx/core/OpcodeInfo.hpp"
#include "ippx/io/OperandParser.hpp"
#include "ippx/io/ParserUtil.hpp"

#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace ippx::io::detail
{
namespace
{
using core::ErrorKind;
using core::Instr;
using core::Opcode;
using core::OpcodeInfo;
using core::OperandCategory;
using core::ParseResult;

/// @brief Reject lines carrying a second opcode mnemonic among their operands.
///
/// Label slots are exempt because a label may legitimately be spelled like an
/// instruction (`JUMP return`).  Every other slot would fail its own grammar
/// anyway; this check reports the more telling diagnostic.
///
/// @param tokens Tokens of the line, opcode first.
/// @param info Signature of the leading opcode.
/// @param st Parser state used for diagnostic locations.
/// @return Empty on success; otherwise a MultipleOpcode error.
ParseResult<void> checkSingleOpcode(const std::vector<Token> &tokens, const OpcodeInfo &info, const ParserState &st)
{
    for (size_t i = 1; i < tokens.size(); ++i)
    {
        const size_t slot = i - 1;
        if (slot < info.numOperands && info.operands[slot] == OperandCategory::Label)
            continue;
        if (!core::lookupOpcode(tokens[i].text))
            continue;
        std::ostringstream oss;
        oss << "unexpected instruction '" << tokens[i].text << "' after " << info.name;
        return ParseResult<void>{core::makeParseError(
            ErrorKind::MultipleOpcode, {st.fileId, st.lineNo, tokens[i].column}, oss.str())};
    }
    return {};
}

/// @brief Ensure the operand count matches the signature exactly.
ParseResult<void> checkArity(const std::vector<Token> &tokens, const OpcodeInfo &info, const ParserState &st)
{
    const size_t operandCount = tokens.size() - 1;
    if (operandCount == info.numOperands)
        return {};

    std::ostringstream oss;
    oss << info.name << " expects " << static_cast<unsigned>(info.numOperands) << " operand";
    if (info.numOperands != 1)
        oss << 's';
    oss << ", got " << operandCount;
    if (info.numOperands != 0)
    {
        oss << " (signature:";
        for (size_t slot = 0; slot < info.numOperands; ++slot)
            oss << ' ' << core::toString(info.operands[slot]);
        oss << ')';
    }
    return ParseResult<void>{core::makeParseError(
        ErrorKind::Arity, {st.fileId, st.lineNo, tokens.front().column}, oss.str())};
}
} // namespace

ParseResult<Instr> parseInstruction(const LogicalLine &line, ParserState &st)
{
    st.lineNo = line.lineNo;
    const std::vector<Token> tokens = splitTokens(line.text, line.column);
    if (tokens.empty())
    {
        return ParseResult<Instr>{core::makeParseError(
            ErrorKind::UnknownOpcode, {st.fileId, st.lineNo, line.column}, "missing instruction")};
    }
    const Token &head = tokens.front();

    const std::optional<Opcode> op = core::lookupOpcode(head.text);
    if (!op)
    {
        return ParseResult<Instr>{core::makeParseError(ErrorKind::UnknownOpcode,
                                                       {st.fileId, st.lineNo, head.column},
                                                       "instruction '" + head.text + "' does not exist")};
    }
    const OpcodeInfo &info = core::getOpcodeInfo(*op);

    if (auto single = checkSingleOpcode(tokens, info, st); !single)
        return ParseResult<Instr>{single.error()};
    if (auto arity = checkArity(tokens, info, st); !arity)
        return ParseResult<Instr>{arity.error()};

    Instr instr;
    instr.op = *op;
    instr.loc = {st.fileId, st.lineNo, head.column};
    instr.operands.reserve(info.numOperands);

    const VarUse use = (*op == Opcode::DefVar) ? VarUse::Define : VarUse::Read;
    for (size_t slot = 0; slot < info.numOperands; ++slot)
    {
        auto operand = classifyOperand(tokens[slot + 1], info.operands[slot], static_cast<unsigned>(slot + 1), st, use);
        if (!operand)
            return ParseResult<Instr>{operand.error()};
        instr.operands.push_back(std::move(operand.value()));
    }

    if (*op == Opcode::DefVar)
    {
        const core::Operand &var = instr.operands.front();
        if (!st.vars.declare(*var.frame, var.name) && !st.opts.allowRedeclaration)
        {
            return ParseResult<Instr>{core::makeParseError(
                ErrorKind::Redeclaration,
                {st.fileId, st.lineNo, tokens[1].column},
                "variable '" + var.text + "' is already defined")};
        }
    }

    instr.order = st.nextOrder++;
    return instr;
}

} // namespace ippx::io::detail
