//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ippx/io/OperandParser.cpp
// Purpose: Implement the operand classifier: variables, typed constants,
//          labels and type names.
// Key invariants: Grammar failures and undeclared variables report distinct
//                 error kinds.
// Ownership/Lifetime: Reads parser state; never retains references to it.
// Links: docs/ippcode24.md#operands
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Resolves instruction operand tokens into typed Operand values.
/// @details Each category has its own helper.  A Symbol slot first tries the
///          variable form and falls back to `type@literal`; the literal
///          grammar is chosen by the type prefix.

#include "ippx/io/OperandParser.hpp"

#include "ippx/io/StringEscape.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace ippx::io::detail
{
namespace
{
using core::ErrorKind;
using core::Frame;
using core::Operand;
using core::OperandCategory;
using core::ParseResult;

/// @brief Build an error result located at @p tok.
ParseResult<Operand> fail(ErrorKind kind, const Token &tok, const ParserState &st, unsigned argIndex,
                          std::string_view what)
{
    std::ostringstream oss;
    oss << "argument " << argIndex << ": " << what << " '" << tok.text << "'";
    return ParseResult<Operand>{core::makeParseError(
        kind, {st.fileId, st.lineNo, tok.column}, oss.str())};
}

/// @brief Split @p text at its first '@'.
/// @return Prefix and payload, or std::nullopt when no '@' is present.
std::optional<std::pair<std::string_view, std::string_view>> splitAt(std::string_view text)
{
    const size_t at = text.find('@');
    if (at == std::string_view::npos)
        return std::nullopt;
    return std::make_pair(text.substr(0, at), text.substr(at + 1));
}

ParseResult<Operand> parseVariable(const Token &tok, unsigned argIndex, const ParserState &st, VarUse use)
{
    auto parts = splitAt(tok.text);
    std::optional<Frame> frame;
    if (parts)
        frame = core::parseFrame(parts->first);
    if (!frame || !isIdentifier(parts->second))
        return fail(ErrorKind::BadVariable, tok, st, argIndex, "invalid variable");

    if (use == VarUse::Read && !st.vars.isDeclared(*frame, parts->second))
        return fail(ErrorKind::UndeclaredVariable, tok, st, argIndex, "undeclared variable");

    return Operand::var(*frame, std::string(parts->second));
}

/// @brief Validate and decode a `type@literal` constant.
ParseResult<Operand> parseConstant(const Token &tok, unsigned argIndex, const ParserState &st)
{
    auto parts = splitAt(tok.text);
    if (!parts)
        return fail(ErrorKind::BadLiteral, tok, st, argIndex, "expected variable or constant, got");

    const std::string_view type = parts->first;
    const std::string_view literal = parts->second;

    if (type == "int")
    {
        long long value = 0;
        if (!parseIntegerLiteral(literal, value))
            return fail(ErrorKind::BadLiteral, tok, st, argIndex, "invalid integer literal");
        return Operand::constInt(std::string(literal), value);
    }
    if (type == "bool")
    {
        if (literal == "true")
            return Operand::constBool(true);
        if (literal == "false")
            return Operand::constBool(false);
        return fail(ErrorKind::BadLiteral, tok, st, argIndex, "invalid bool literal");
    }
    if (type == "nil")
    {
        if (literal == "nil")
            return Operand::constNil();
        return fail(ErrorKind::BadLiteral, tok, st, argIndex, "invalid nil literal");
    }
    if (type == "string")
    {
        std::string decoded;
        std::string err;
        if (!decodeEscapedString(literal, decoded, &err))
            return fail(ErrorKind::BadLiteral, tok, st, argIndex, err + " in string literal");
        return Operand::constStr(std::move(decoded));
    }
    return fail(ErrorKind::BadLiteral, tok, st, argIndex, "unknown constant type in");
}

ParseResult<Operand> parseSymbol(const Token &tok, unsigned argIndex, const ParserState &st)
{
    auto parts = splitAt(tok.text);
    if (parts && core::parseFrame(parts->first))
        return parseVariable(tok, argIndex, st, VarUse::Read);
    return parseConstant(tok, argIndex, st);
}

ParseResult<Operand> parseLabel(const Token &tok, unsigned argIndex, const ParserState &st)
{
    if (!isIdentifier(tok.text))
        return fail(ErrorKind::BadLabel, tok, st, argIndex, "invalid label");
    return Operand::label(tok.text);
}

ParseResult<Operand> parseTypeName(const Token &tok, unsigned argIndex, const ParserState &st)
{
    if (tok.text == "int" || tok.text == "bool" || tok.text == "string")
        return Operand::typeName(tok.text);
    return fail(ErrorKind::BadType, tok, st, argIndex, "invalid type name");
}
} // namespace

ParseResult<Operand> classifyOperand(
    const Token &tok, OperandCategory expected, unsigned argIndex, const ParserState &st, VarUse use)
{
    switch (expected)
    {
        case OperandCategory::Variable:
            return parseVariable(tok, argIndex, st, use);
        case OperandCategory::Symbol:
            return parseSymbol(tok, argIndex, st);
        case OperandCategory::Label:
            return parseLabel(tok, argIndex, st);
        case OperandCategory::Type:
            return parseTypeName(tok, argIndex, st);
    }
    return fail(ErrorKind::BadLiteral, tok, st, argIndex, "unclassifiable operand");
}

} // namespace ippx::io::detail
