//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the translation pipeline behind the `ippx-parse` executable:
// argument handling, reading the whole input, parsing, and rendering XML.
// This is the only place where a failure becomes a process exit status.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the shared driver for the `ippx-parse` tool.
/// @details Nothing is written to the output stream unless the whole program
///          parsed; the XML is rendered into a buffer first so a write failure
///          can still be reported with its own status.

#include "tools/ippx-parse/driver.hpp"

#include "ippx/io/Parser.hpp"
#include "ippx/io/ParserOptions.hpp"
#include "ippx/io/ParserUtil.hpp"
#include "ippx/io/XmlSerializer.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/ArgvView.hpp"
#include "tools/ippx-parse/cli.hpp"
#include "tools/ippx-parse/exit_codes.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace ippx::tools::parse
{
namespace
{
int report(const ippx::support::Diag &diag, ExitCode code, std::ostream &err, const ippx::support::SourceManager &sm)
{
    ippx::support::printDiag(diag, err, &sm);
    return toInt(code);
}
} // namespace

int runCLI(int argc,
           char **argv,
           std::istream &in,
           std::ostream &out,
           std::ostream &err,
           ippx::support::SourceManager &sm)
{
    const CliResult cli = parseArgs(ArgvView{argc, argv}.drop_front());
    switch (cli.status)
    {
        case CliStatus::Help:
            printUsage(out);
            return toInt(ExitCode::Success);
        case CliStatus::Error:
            err << "error: unrecognized argument '" << cli.offending << "'\n"
                << "Try 'ippx-parse --help' for more information.\n";
            return toInt(ExitCode::BadParameter);
        case CliStatus::Run:
            break;
    }

    const uint32_t fileId = sm.addFile(std::string(ippx::support::kStdinPath));
    if (fileId == 0)
    {
        return report(ippx::support::makeError({}, "source manager exhausted file identifier space"),
                      ExitCode::InternalError,
                      err,
                      sm);
    }

    std::vector<std::string> lines;
    if (!ippx::io::readLines(in, lines))
        return report(ippx::support::makeError({}, "cannot read standard input"), ExitCode::InputError, err, sm);

    const ippx::io::ParserOptions opts;
    auto program = ippx::io::Parser::parse(lines, opts, fileId);
    if (!program)
        return report(program.error().diag, exitCodeFor(program.error().kind), err, sm);

    const std::string xml = ippx::io::XmlSerializer::toString(program.value(), ippx::io::XmlSerializer::Mode::Pretty);
    out << xml;
    out.flush();
    if (!out)
        return report(ippx::support::makeError({}, "cannot write standard output"), ExitCode::OutputError, err, sm);
    return toInt(ExitCode::Success);
}

} // namespace ippx::tools::parse
