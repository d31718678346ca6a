// File: src/ippx/io/InstrParser.hpp
// Purpose: Declares the parser turning one logical line into a validated instruction.
// Key invariants: No Instr is produced unless every check for its line passed.
// Ownership/Lifetime: Mutates the caller-owned ParserState.
// Links: docs/ippcode24.md#instructions
#pragma once

#include "ippx/core/Instr.hpp"
#include "ippx/core/ParseError.hpp"
#include "ippx/io/LinePreprocessor.hpp"
#include "ippx/io/ParserState.hpp"

namespace ippx::io::detail
{

/// @brief Parse and validate a single instruction line.
/// @details Checks, in order: opcode existence, stray opcode-like tokens,
///          operand count, then each operand's category.  A successful DEFVAR
///          registers its variable in @p st before returning, and every
///          success consumes the next order number.
/// @param line Logical line produced by the preprocessor.
/// @param st Parse state updated on success.
/// @return Validated instruction or the first error found on the line.
core::ParseResult<core::Instr> parseInstruction(const LogicalLine &line, ParserState &st);

} // namespace ippx::io::detail
