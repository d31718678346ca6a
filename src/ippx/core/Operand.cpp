//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Operand factories and the spelling tables shared by the
// classifier, the diagnostics and the XML renderer.
//
//===----------------------------------------------------------------------===//

#include "ippx/core/Operand.hpp"

#include <utility>

namespace ippx::core
{

Operand Operand::var(Frame frame, std::string name)
{
    Operand op;
    op.kind = OperandKind::Var;
    op.text = std::string(framePrefix(frame)) + "@" + name;
    op.frame = frame;
    op.name = std::move(name);
    return op;
}

Operand Operand::constInt(std::string spelling, long long value)
{
    Operand op;
    op.kind = OperandKind::Int;
    op.text = std::move(spelling);
    op.intValue = value;
    return op;
}

Operand Operand::constBool(bool value)
{
    Operand op;
    op.kind = OperandKind::Bool;
    op.text = value ? "true" : "false";
    return op;
}

Operand Operand::constStr(std::string decoded)
{
    Operand op;
    op.kind = OperandKind::String;
    op.text = std::move(decoded);
    return op;
}

Operand Operand::constNil()
{
    Operand op;
    op.kind = OperandKind::Nil;
    op.text = "nil";
    return op;
}

Operand Operand::label(std::string name)
{
    Operand op;
    op.kind = OperandKind::Label;
    op.text = std::move(name);
    return op;
}

Operand Operand::typeName(std::string name)
{
    Operand op;
    op.kind = OperandKind::Type;
    op.text = std::move(name);
    return op;
}

std::string_view toString(OperandKind kind)
{
    switch (kind)
    {
        case OperandKind::Var:
            return "var";
        case OperandKind::Int:
            return "int";
        case OperandKind::Bool:
            return "bool";
        case OperandKind::String:
            return "string";
        case OperandKind::Nil:
            return "nil";
        case OperandKind::Label:
            return "label";
        case OperandKind::Type:
            return "type";
    }
    return "";
}

std::string_view toString(OperandCategory category)
{
    switch (category)
    {
        case OperandCategory::Variable:
            return "var";
        case OperandCategory::Symbol:
            return "symb";
        case OperandCategory::Label:
            return "label";
        case OperandCategory::Type:
            return "type";
    }
    return "";
}

std::string_view framePrefix(Frame frame)
{
    switch (frame)
    {
        case Frame::Global:
            return "GF";
        case Frame::Local:
            return "LF";
        case Frame::Temporary:
            return "TF";
    }
    return "";
}

std::optional<Frame> parseFrame(std::string_view prefix)
{
    if (prefix == "GF")
        return Frame::Global;
    if (prefix == "LF")
        return Frame::Local;
    if (prefix == "TF")
        return Frame::Temporary;
    return std::nullopt;
}

} // namespace ippx::core
