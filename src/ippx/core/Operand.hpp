//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ippx/core/Operand.hpp
// Purpose: Declares operand categories, resolved operand kinds and the Operand
//          value produced by the classifier.
// Key invariants: An Operand is only constructed after its token passed the
//                 grammar of the category expected at its position.
// Ownership/Lifetime: Operand is a value type owning its text.
// Links: docs/ippcode24.md#operands
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ippx::core
{

/// @brief Abstract operand slot expected by an instruction signature.
enum class OperandCategory
{
    Variable, ///< `frame@name`
    Symbol,   ///< A variable or a typed constant.
    Label,    ///< Bare label name.
    Type      ///< One of `int`, `bool`, `string`.
};

/// @brief Concrete operand kind after classification.
enum class OperandKind
{
    Var,
    Int,
    Bool,
    String,
    Nil,
    Label,
    Type
};

/// @brief Variable storage scope named by a `GF@`/`LF@`/`TF@` prefix.
enum class Frame
{
    Global,
    Local,
    Temporary
};

/// @brief Classified instruction operand.
struct Operand
{
    /// @brief Resolved kind.
    OperandKind kind = OperandKind::Var;

    /// @brief Text emitted by the renderer: the full `frame@name` for
    ///        variables, the decoded payload for constants, the token itself
    ///        for labels and type names.
    std::string text;

    /// @brief Frame of a variable operand.
    std::optional<Frame> frame;

    /// @brief Bare variable name without the frame prefix.
    std::string name;

    /// @brief Numeric value of an `int` constant.
    std::optional<long long> intValue;

    /// @brief Construct a variable operand.
    static Operand var(Frame frame, std::string name);

    /// @brief Construct an integer constant keeping its source spelling.
    static Operand constInt(std::string spelling, long long value);

    /// @brief Construct a boolean constant.
    static Operand constBool(bool value);

    /// @brief Construct a string constant from its decoded payload.
    static Operand constStr(std::string decoded);

    /// @brief Construct the `nil` constant.
    static Operand constNil();

    /// @brief Construct a label reference.
    static Operand label(std::string name);

    /// @brief Construct a type-name operand.
    static Operand typeName(std::string name);
};

/// @brief Spelling used for @p kind in the XML `type` attribute.
std::string_view toString(OperandKind kind);

/// @brief Short spelling of @p category used in diagnostics.
std::string_view toString(OperandCategory category);

/// @brief Frame prefix without the `@`, e.g. "GF".
std::string_view framePrefix(Frame frame);

/// @brief Parse a frame prefix; case-sensitive.
std::optional<Frame> parseFrame(std::string_view prefix);

} // namespace ippx::core
