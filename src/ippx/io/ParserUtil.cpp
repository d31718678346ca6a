//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements lexical helper functions used by the IPPcode24 parser.
//
//===----------------------------------------------------------------------===//

#include "ippx/io/ParserUtil.hpp"

#include <cctype>
#include <limits>

namespace ippx::io
{
namespace
{
bool isSpace(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool isIdentifierSpecial(char ch)
{
    switch (ch)
    {
        case '_':
        case '-':
        case '$':
        case '&':
        case '%':
        case '*':
        case '!':
        case '?':
            return true;
        default:
            return false;
    }
}

/// @brief Numeric value of @p ch in @p base, or -1 when it is not a digit of that base.
int digitValue(char ch, unsigned base)
{
    int value = -1;
    if (ch >= '0' && ch <= '9')
        value = ch - '0';
    else if (ch >= 'a' && ch <= 'f')
        value = 10 + (ch - 'a');
    else if (ch >= 'A' && ch <= 'F')
        value = 10 + (ch - 'A');
    if (value < 0 || static_cast<unsigned>(value) >= base)
        return -1;
    return value;
}
} // namespace

std::string trim(std::string_view text)
{
    size_t begin = 0;
    while (begin < text.size() && isSpace(text[begin]))
        ++begin;
    size_t end = text.size();
    while (end > begin && isSpace(text[end - 1]))
        --end;
    return std::string(text.substr(begin, end - begin));
}

std::vector<Token> splitTokens(std::string_view text, uint32_t firstColumn)
{
    std::vector<Token> tokens;
    size_t pos = 0;
    while (pos < text.size())
    {
        while (pos < text.size() && isSpace(text[pos]))
            ++pos;
        if (pos >= text.size())
            break;
        const size_t begin = pos;
        while (pos < text.size() && !isSpace(text[pos]))
            ++pos;
        tokens.push_back(
            Token{std::string(text.substr(begin, pos - begin)), firstColumn + static_cast<uint32_t>(begin)});
    }
    return tokens;
}

bool isIdentifier(std::string_view text)
{
    if (text.empty())
        return false;
    const unsigned char first = static_cast<unsigned char>(text.front());
    if (!std::isalpha(first) && !isIdentifierSpecial(text.front()))
        return false;
    for (size_t i = 1; i < text.size(); ++i)
    {
        const unsigned char ch = static_cast<unsigned char>(text[i]);
        if (!std::isalnum(ch) && !isIdentifierSpecial(text[i]))
            return false;
    }
    return true;
}

bool parseIntegerLiteral(std::string_view token, long long &value)
{
    size_t pos = 0;
    bool negative = false;
    if (pos < token.size() && (token[pos] == '+' || token[pos] == '-'))
    {
        negative = (token[pos] == '-');
        ++pos;
    }

    unsigned base = 10;
    if (pos + 1 < token.size() && token[pos] == '0')
    {
        const char marker = token[pos + 1];
        if (marker == 'x' || marker == 'X')
        {
            base = 16;
            pos += 2;
        }
        else if (marker == 'o' || marker == 'O')
        {
            base = 8;
            pos += 2;
        }
    }
    if (pos >= token.size())
        return false;

    // Accumulate as a negative magnitude so LLONG_MIN stays representable.
    constexpr long long kMin = std::numeric_limits<long long>::min();
    long long acc = 0;
    for (; pos < token.size(); ++pos)
    {
        const int digit = digitValue(token[pos], base);
        if (digit < 0)
            return false;
        if (acc < (kMin + digit) / static_cast<long long>(base))
            return false;
        acc = acc * static_cast<long long>(base) - digit;
    }

    if (negative)
    {
        value = acc;
        return true;
    }
    if (acc == kMin)
        return false;
    value = -acc;
    return true;
}

bool readLines(std::istream &is, std::vector<std::string> &lines)
{
    std::string line;
    while (std::getline(is, line))
        lines.push_back(line);
    return !is.bad();
}

} // namespace ippx::io
