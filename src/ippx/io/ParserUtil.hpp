// File: src/ippx/io/ParserUtil.hpp
// Purpose: Declares lexical helpers shared by the translator's parser components.
// Key invariants: Helpers treat input as ASCII-compatible bytes.
// Ownership/Lifetime: Stateless utility routines operate on caller-provided data.
// Links: docs/ippcode24.md#lexical-structure
#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace ippx::io
{

/// @brief Whitespace-delimited token with its 1-based column in the physical line.
struct Token
{
    std::string text;
    uint32_t column = 0;
};

/// @brief Remove leading and trailing whitespace from the supplied text.
/// @param text Input that may contain surrounding whitespace.
/// @return Copy with surrounding whitespace stripped.
std::string trim(std::string_view text);

/// @brief Split @p text on runs of whitespace.
/// @param text Logical line content.
/// @param firstColumn Column of text[0] within its physical line.
/// @return Tokens in textual order.
std::vector<Token> splitTokens(std::string_view text, uint32_t firstColumn = 1);

/// @brief Check @p text against the label/variable-name grammar.
/// @details The first character is a letter or one of `_-$&%*!?`; the rest
///          are letters, digits or those same special characters.
bool isIdentifier(std::string_view text);

/// @brief Attempt to parse an IPPcode24 integer literal payload.
/// @details Accepts an optional sign followed by decimal digits, `0o`/`0O`
///          octal digits or `0x`/`0X` hexadecimal digits.
/// @param token Literal text after `int@`.
/// @param value Destination receiving the parsed value on success.
/// @return True if the whole token matched the grammar and fits in 64 bits.
bool parseIntegerLiteral(std::string_view token, long long &value);

/// @brief Read every line of @p is into @p lines.
/// @return False when the stream reported a read failure other than end of input.
bool readLines(std::istream &is, std::vector<std::string> &lines);

} // namespace ippx::io
