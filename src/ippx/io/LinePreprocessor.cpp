//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the line preprocessing stage of the translator: comment removal,
// whitespace trimming, blank-line elision and the mandatory header check.
//
//===----------------------------------------------------------------------===//

#include "ippx/io/LinePreprocessor.hpp"

#include "ippx/io/ParserUtil.hpp"

#include <cctype>
#include <string_view>

namespace ippx::io
{
namespace
{
using core::ErrorKind;
using core::makeParseError;

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

/// @brief Cut @p raw at its first comment marker and trim the remainder.
/// @param raw Physical line.
/// @param column Receives the 1-based column of the first retained character.
std::string stripLine(std::string_view raw, uint32_t &column)
{
    const size_t hash = raw.find('#');
    if (hash != std::string_view::npos)
        raw = raw.substr(0, hash);
    size_t lead = 0;
    while (lead < raw.size() && std::isspace(static_cast<unsigned char>(raw[lead])))
        ++lead;
    column = static_cast<uint32_t>(lead + 1);
    return trim(raw);
}
} // namespace

core::ParseResult<PreprocessedSource> preprocess(const std::vector<std::string> &rawLines,
                                                 const ParserOptions &opts,
                                                 uint32_t fileId)
{
    PreprocessedSource out;
    const std::string header = opts.headerToken();

    for (size_t index = 0; index < rawLines.size(); ++index)
    {
        std::string_view raw = rawLines[index];
        uint32_t bomWidth = 0;
        if (index == 0 && raw.substr(0, kUtf8Bom.size()) == kUtf8Bom)
        {
            raw.remove_prefix(kUtf8Bom.size());
            bomWidth = static_cast<uint32_t>(kUtf8Bom.size());
        }

        uint32_t column = 1;
        std::string text = stripLine(raw, column);
        if (text.empty())
            continue;

        const uint32_t lineNo = static_cast<uint32_t>(index + 1);
        if (!out.headerOk)
        {
            if (text != header)
            {
                return core::ParseResult<PreprocessedSource>{makeParseError(
                    ErrorKind::Header,
                    {fileId, lineNo, column + bomWidth},
                    "expected header '" + header + "', found '" + text + "'")};
            }
            out.headerOk = true;
            continue;
        }

        out.lines.push_back(LogicalLine{std::move(text), lineNo, column});
    }

    if (!out.headerOk)
    {
        return core::ParseResult<PreprocessedSource>{
            makeParseError(ErrorKind::Header, {fileId, 0, 0}, "missing header '" + header + "'")};
    }
    return out;
}

} // namespace ippx::io
