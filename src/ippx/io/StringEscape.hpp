// File: src/ippx/io/StringEscape.hpp
// Purpose: Declare helpers for decoding IPPcode24 string literals and escaping XML text.
// Key invariants: Decoders reject malformed escape sequences; encoders always
//                 produce well-formed XML character data.
// Ownership/Lifetime: Stateless utility functions.
// License: GNU GPL v3 (see LICENSE).
// Links: docs/ippcode24.md#string-literals
#pragma once

#include <string>
#include <string_view>

namespace ippx::io
{

/// @brief Decode `\DDD` escape sequences from a string literal payload.
/// @param input Literal text following `string@`.
/// @param output Destination for the decoded UTF-8 string.
/// @param error Optional pointer receiving a human-readable error message on failure.
/// @return True on success; false if @p input contains a backslash not followed
///         by exactly three decimal digits, or an escape naming a control
///         character other than TAB (009), LF (010) or CR (013).
bool decodeEscapedString(std::string_view input, std::string &output, std::string *error = nullptr);

/// @brief Escape XML markup characters in @p input.
/// @param input Raw UTF-8 text.
/// @return Text with `&`, `<`, `>`, `"` and `'` replaced by entities and CR
///         written as `&#13;` so parsers do not fold it into LF.
inline std::string encodeXmlText(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    for (char c : input)
    {
        switch (c)
        {
            case '&':
                out.append("&amp;");
                break;
            case '<':
                out.append("&lt;");
                break;
            case '>':
                out.append("&gt;");
                break;
            case '\"':
                out.append("&quot;");
                break;
            case '\'':
                out.append("&apos;");
                break;
            case '\r':
                out.append("&#13;");
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

} // namespace ippx::io
