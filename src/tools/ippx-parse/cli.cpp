//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements argument parsing for ippx-parse.  The tool reads the program
// from standard input, so the only recognised argument is the help flag, and
// it must appear alone.
//
//===----------------------------------------------------------------------===//

#include "tools/ippx-parse/cli.hpp"

namespace ippx::tools::parse
{

CliResult parseArgs(ArgvView args)
{
    CliResult result;
    for (int i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args.at(i);
        if ((arg == "-h" || arg == "--help") && args.size() == 1)
        {
            result.status = CliStatus::Help;
            continue;
        }
        result.status = CliStatus::Error;
        result.offending = std::string(arg);
        return result;
    }
    return result;
}

void printUsage(std::ostream &os)
{
    os << "ippx-parse: translate IPPcode24 source into its XML representation.\n"
       << "\n"
       << "Usage: ippx-parse [options] < input.ipp > output.xml\n"
       << "\n"
       << "Options:\n"
       << "  -h, --help                     Show this help message\n"
       << "\n"
       << "Exit status:\n"
       << "  0   success\n"
       << "  10  invalid command-line arguments\n"
       << "  11  standard input could not be read\n"
       << "  12  standard output could not be written\n"
       << "  21  missing or malformed .IPPcode24 header\n"
       << "  22  unknown instruction\n"
       << "  23  other lexical, syntactic or semantic error\n"
       << "  99  internal error\n";
}

} // namespace ippx::tools::parse
