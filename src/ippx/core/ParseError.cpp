//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the identifiers and constructors for translator errors.
//
//===----------------------------------------------------------------------===//

#include "ippx/core/ParseError.hpp"

#include <utility>

namespace ippx::core
{

std::string_view errorKindId(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::Header:
            return "E_HEADER";
        case ErrorKind::UnknownOpcode:
            return "E_UNKNOWN_OPCODE";
        case ErrorKind::Arity:
            return "E_ARITY";
        case ErrorKind::BadVariable:
            return "E_BAD_VARIABLE";
        case ErrorKind::BadLiteral:
            return "E_BAD_LITERAL";
        case ErrorKind::BadLabel:
            return "E_BAD_LABEL";
        case ErrorKind::BadType:
            return "E_BAD_TYPE";
        case ErrorKind::UndeclaredVariable:
            return "E_UNDECLARED_VARIABLE";
        case ErrorKind::Redeclaration:
            return "E_REDECLARATION";
        case ErrorKind::MultipleOpcode:
            return "E_MULTIPLE_OPCODE";
        case ErrorKind::EmptyProgram:
            return "E_EMPTY_PROGRAM";
    }
    return "E_UNKNOWN";
}

bool isOperandSyntaxError(ErrorKind kind)
{
    return kind == ErrorKind::BadVariable || kind == ErrorKind::BadLiteral ||
           kind == ErrorKind::BadLabel || kind == ErrorKind::BadType;
}

ParseError makeParseError(ErrorKind kind, ippx::support::SourceLoc loc, std::string message)
{
    std::string text;
    text.reserve(message.size() + 24);
    text.append(errorKindId(kind));
    text.append(": ");
    text.append(message);
    return ParseError{kind, ippx::support::makeError(loc, std::move(text))};
}

} // namespace ippx::core
