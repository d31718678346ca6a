// File: src/ippx/io/OperandParser.hpp
// Purpose: Declares the operand classifier that resolves a token against the
//          category expected by an instruction signature.
// Key invariants: Classification never mutates the declared-variable sets.
// Ownership/Lifetime: Produces owned Operand values; borrows parser state.
// Links: docs/ippcode24.md#operands
#pragma once

#include "ippx/core/Operand.hpp"
#include "ippx/core/ParseError.hpp"
#include "ippx/io/ParserState.hpp"
#include "ippx/io/ParserUtil.hpp"

namespace ippx::io::detail
{

/// @brief How a variable operand is used by its instruction.
enum class VarUse
{
    Read,  ///< Must have been declared earlier (GF/LF).
    Define ///< Introduced by this instruction; not checked.
};

/// @brief Classify @p tok as an operand of category @p expected.
/// @param tok Token and its column.
/// @param expected Category demanded by the signature at this position.
/// @param argIndex 1-based operand position, used in diagnostics.
/// @param st Parse state supplying the line number and declared variables.
/// @param use Whether a variable operand is being read or defined.
/// @return Classified operand, or the grammar / declaration error.
core::ParseResult<core::Operand> classifyOperand(const Token &tok,
                                                 core::OperandCategory expected,
                                                 unsigned argIndex,
                                                 const ParserState &st,
                                                 VarUse use = VarUse::Read);

} // namespace ippx::io::detail
