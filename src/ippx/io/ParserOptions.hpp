//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ippx/io/ParserOptions.hpp
// Purpose: Declares the settings that select between the permissive and strict
//          readings of the IPPcode24 source rules.
// Key invariants: Flags are independent; defaults describe the shipped tool.
// Ownership/Lifetime: Value type owned by the caller.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace ippx::io
{

/// @brief Holds settings that influence how a source program is accepted.
/// @invariant Flags are independent booleans.
/// @ownership Value type.
struct ParserOptions
{
    /// @brief Language name; the header line must read "." + language.
    std::string language = "IPPcode24";

    /// @brief Accept a program with a header and no instructions.
    bool allowEmptyProgram = true;

    /// @brief Accept a DEFVAR of a name already declared in the same frame.
    bool allowRedeclaration = true;

    /// @brief Header token expected on the first logical line.
    [[nodiscard]] std::string headerToken() const
    {
        return "." + language;
    }
};

} // namespace ippx::io
