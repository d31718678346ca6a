//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/ippx-parse/exit_codes.hpp
// Purpose: Declares the process exit statuses of ippx-parse and the mapping
//          from translator error kinds to those statuses.
// Key invariants: Each status value is distinct and stable.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ippx/core/ParseError.hpp"

namespace ippx::tools::parse
{

/// @brief Process exit statuses reported by ippx-parse.
enum class ExitCode : int
{
    Success = 0,
    BadParameter = 10,  ///< Unknown option or stray argument.
    InputError = 11,    ///< Standard input could not be read.
    OutputError = 12,   ///< Standard output could not be written.
    HeaderError = 21,   ///< Missing or malformed header.
    OpcodeError = 22,   ///< Unknown instruction.
    SyntaxError = 23,   ///< Any other lexical, syntactic or static-semantic error.
    InternalError = 99  ///< Unexpected failure inside the tool.
};

/// @brief Integral process status for @p code.
[[nodiscard]] constexpr int toInt(ExitCode code)
{
    return static_cast<int>(code);
}

/// @brief Exit status designated for translator errors of @p kind.
[[nodiscard]] ExitCode exitCodeFor(core::ErrorKind kind);

} // namespace ippx::tools::parse
