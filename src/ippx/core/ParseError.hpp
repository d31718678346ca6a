//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ippx/core/ParseError.hpp
// Purpose: Declares the error taxonomy reported by the translator core.
// Key invariants: Every failure carries exactly one ErrorKind; identifiers are stable.
// Ownership/Lifetime: ParseError is a value type owning its diagnostic.
// Links: docs/ippcode24.md#errors
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace ippx::core
{

/// @brief Classification of a fatal translation error.
/// @details The driver maps each kind to a process exit status; callers that
///          need to tell an unknown opcode from a malformed operand branch on
///          this value rather than on message text.
enum class ErrorKind
{
    Header,             ///< Missing or malformed `.IPPcode24` header.
    UnknownOpcode,      ///< Opcode not present in the signature table.
    Arity,              ///< Wrong operand count for a known opcode.
    BadVariable,        ///< Token is not a well-formed `frame@name`.
    BadLiteral,         ///< Token is not a variable or a well-formed constant.
    BadLabel,           ///< Token is not a valid label name.
    BadType,            ///< Token is not `int`, `bool` or `string`.
    UndeclaredVariable, ///< GF/LF variable used before its DEFVAR.
    Redeclaration,      ///< DEFVAR repeated while redeclaration is disallowed.
    MultipleOpcode,     ///< More than one opcode-like token on a line.
    EmptyProgram        ///< No instructions while empty programs are disallowed.
};

/// @brief Stable identifier for @p kind, e.g. "E_ARITY".
std::string_view errorKindId(ErrorKind kind);

/// @brief True for the operand grammar failures (bad variable, literal, label, type).
bool isOperandSyntaxError(ErrorKind kind);

/// @brief Fatal error produced by the translator core.
struct ParseError
{
    ErrorKind kind;
    ippx::support::Diag diag;
};

/// @brief Result type used throughout the parser layers.
template <class T> using ParseResult = ippx::support::Expected<T, ParseError>;

/// @brief Build a ParseError whose message is prefixed with the kind identifier.
/// @param kind Error classification.
/// @param loc Location of the offending line or token.
/// @param message Human-readable description.
ParseError makeParseError(ErrorKind kind, ippx::support::SourceLoc loc, std::string message);

} // namespace ippx::core
