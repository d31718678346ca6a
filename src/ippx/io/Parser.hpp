//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Parser class, which reads IPPcode24 source text and
// assembles a validated Program.  The parser is the front half of the
// ippx-parse tool; XmlSerializer is the back half.
//
// Pipeline:
// - LinePreprocessor: strip comments and blank lines, validate the header
// - InstrParser: per-line opcode lookup, arity and operand checks
// - OperandParser: variable / constant / label / type classification
// - ParserState: declared-variable sets and the running order counter
//
// Error Handling:
// The parser stops at the first error.  Failures are returned as a ParseError
// carrying an ErrorKind and a located diagnostic; nothing is thrown and no
// partial Program is returned.
//
// Usage Example:
//   std::vector<std::string> lines;
//   if (!readLines(std::cin, lines))
//     return kInputError;
//   auto program = Parser::parse(lines, ParserOptions{});
//   if (!program)
//     printDiag(program.error().diag, std::cerr);
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ippx/core/ParseError.hpp"
#include "ippx/core/Program.hpp"
#include "ippx/io/ParserOptions.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ippx::io
{

/// @brief Hand-rolled parser for IPPcode24 programs.
class Parser
{
  public:
    /// @brief Parse already-split source lines into a Program.
    /// @param lines Physical lines without terminators.
    /// @param opts Acceptance settings.
    /// @param fileId SourceManager identifier used for diagnostic locations.
    /// @return Program on success or the first error encountered.
    [[nodiscard]] static core::ParseResult<core::Program> parse(const std::vector<std::string> &lines,
                                                                const ParserOptions &opts,
                                                                uint32_t fileId = 0);
};

} // namespace ippx::io
