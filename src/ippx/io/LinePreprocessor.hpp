// File: src/ippx/io/LinePreprocessor.hpp
// Purpose: Declares comment stripping, blank-line removal and header validation.
// Key invariants: The header is validated before any instruction line is produced.
// Ownership/Lifetime: Returns owned copies of the logical lines.
// Links: docs/ippcode24.md#lexical-structure
#pragma once

#include "ippx/core/ParseError.hpp"
#include "ippx/io/ParserOptions.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ippx::io
{

/// @brief Source line after comment stripping and trimming.
struct LogicalLine
{
    std::string text;     ///< Non-empty trimmed content.
    uint32_t lineNo = 0;  ///< 1-based physical line number.
    uint32_t column = 1;  ///< Column of text[0] within the physical line.
};

/// @brief Output of the preprocessing stage.
struct PreprocessedSource
{
    bool headerOk = false;
    std::vector<LogicalLine> lines; ///< Instruction lines following the header.
};

/// @brief Strip comments and blank lines and validate the header.
/// @details Every physical line is cut at its first `#` and trimmed; lines that
///          become empty are dropped.  The first remaining line must equal
///          `opts.headerToken()` exactly (case-sensitive).  A UTF-8 byte-order
///          mark at the start of the input is ignored.
/// @param rawLines Physical lines without terminators.
/// @param opts Parser settings supplying the header token.
/// @param fileId SourceManager identifier used for diagnostic locations.
/// @return Instruction lines, or a Header error.
core::ParseResult<PreprocessedSource> preprocess(const std::vector<std::string> &rawLines,
                                                 const ParserOptions &opts,
                                                 uint32_t fileId = 0);

} // namespace ippx::io
