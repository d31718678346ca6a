//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the façade entry point that assembles a Program from source
// lines.  Preprocessing and per-line parsing live in dedicated helpers; this
// translation unit sequences them and owns the parse state.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Top-level IPPcode24 parser implementation.
/// @details The header is validated before any instruction is examined, so a
///          bad header is always reported ahead of instruction errors.  The
///          parse state is created fresh for every call, giving each run empty
///          declared-variable sets and an order counter starting at one.

#include "ippx/io/Parser.hpp"

#include "ippx/io/InstrParser.hpp"
#include "ippx/io/LinePreprocessor.hpp"
#include "ippx/io/ParserState.hpp"

#include <utility>

namespace ippx::io
{

core::ParseResult<core::Program> Parser::parse(const std::vector<std::string> &lines,
                                               const ParserOptions &opts,
                                               uint32_t fileId)
{
    auto source = preprocess(lines, opts, fileId);
    if (!source)
        return core::ParseResult<core::Program>{source.error()};

    core::Program program;
    program.language = opts.language;
    program.headerAccepted = source.value().headerOk;

    detail::ParserState st{opts, fileId};
    program.instructions.reserve(source.value().lines.size());
    for (const LogicalLine &line : source.value().lines)
    {
        auto instr = detail::parseInstruction(line, st);
        if (!instr)
            return core::ParseResult<core::Program>{instr.error()};
        program.instructions.push_back(std::move(instr.value()));
    }

    if (program.instructions.empty() && !opts.allowEmptyProgram)
    {
        return core::ParseResult<core::Program>{core::makeParseError(
            core::ErrorKind::EmptyProgram, {fileId, 0, 0}, "program contains no instructions")};
    }
    return program;
}

} // namespace ippx::io
