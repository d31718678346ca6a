//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ippx/io/StringEscape.cpp
// Purpose: Implement the string literal decoder used by the operand classifier.
// Links: docs/ippcode24.md#string-literals
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Defines the helper used to decode escape sequences in string constants.
/// @details The only escape form in IPPcode24 is a backslash followed by exactly
///          three decimal digits giving a character code.  Codes are emitted
///          as UTF-8 so the decoded payload can be written into the XML output
///          unchanged apart from markup escaping.

#include "ippx/io/StringEscape.hpp"

#include <cstdint>
#include <string>

namespace ippx::io
{
namespace
{
bool isDecimal(char c)
{
    return c >= '0' && c <= '9';
}

/// @brief Append @p code to @p out using UTF-8 encoding.
/// @param code Character code in the range [0, 999].
/// @brief True when @p code is a character XML 1.0 can carry.
/// @details C0 controls other than TAB, LF and CR are excluded from the XML
///          `Char` production, including as character references.
bool isXmlChar(uint32_t code)
{
    return code >= 0x20 || code == 0x09 || code == 0x0A || code == 0x0D;
}

void appendUtf8(std::string &out, uint32_t code)
{
    if (code < 0x80)
    {
        out.push_back(static_cast<char>(code));
    }
    else if (code < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (code >> 6)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xE0 | (code >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}
} // namespace

/// @brief Decode `\DDD` escapes embedded in a string constant.
/// @details Walks @p input left-to-right, copying ordinary characters directly
///          into @p output.  A backslash must be followed by three decimal
///          digits; anything else aborts decoding with an explanatory message.
/// @param input Literal payload (without the `string@` prefix).
/// @param output Destination string populated with the decoded characters.
/// @param error Optional pointer that receives an explanatory message when
///              decoding fails.
/// @return True when decoding succeeds; false otherwise.
bool decodeEscapedString(std::string_view input, std::string &output, std::string *error)
{
    output.clear();
    for (std::size_t i = 0; i < input.size(); ++i)
    {
        const char c = input[i];
        if (c != '\\')
        {
            output.push_back(c);
            continue;
        }
        if (i + 3 >= input.size() || !isDecimal(input[i + 1]) || !isDecimal(input[i + 2]) ||
            !isDecimal(input[i + 3]))
        {
            if (error)
                *error = "escape sequence must be a backslash followed by three decimal digits";
            return false;
        }
        const uint32_t code = static_cast<uint32_t>((input[i + 1] - '0') * 100 + (input[i + 2] - '0') * 10 +
                                                    (input[i + 3] - '0'));
        if (!isXmlChar(code))
        {
            if (error)
                *error = "escape \\" + std::string(input.substr(i + 1, 3)) + " names a control character";
            return false;
        }
        appendUtf8(output, code);
        i += 3;
    }
    return true;
}

} // namespace ippx::io
