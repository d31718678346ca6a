//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the standalone `ippx-parse` CLI.  The executable reads an
// IPPcode24 program from standard input, validates it, and writes the XML
// representation to standard output.  All resources, including the source
// manager, are owned locally for the duration of the process.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"
#include "tools/ippx-parse/driver.hpp"
#include "tools/ippx-parse/exit_codes.hpp"

#include <exception>
#include <iostream>
#include <string>

/// @brief Entry point for the `ippx-parse` binary.
///
/// @details Delegates to @ref ippx::tools::parse::runCLI with the process
///          streams.  Exceptions escaping the pipeline (allocation failure,
///          stream exceptions) are reported as internal errors.
#ifndef IPPX_PARSE_SKIP_MAIN
int main(int argc, char **argv)
{
    ippx::support::SourceManager sm;
    try
    {
        return ippx::tools::parse::runCLI(argc, argv, std::cin, std::cout, std::cerr, sm);
    }
    catch (const std::exception &ex)
    {
        auto diag = ippx::support::makeError({}, std::string("internal error: ") + ex.what());
        ippx::support::printDiag(diag, std::cerr);
        return ippx::tools::parse::toInt(ippx::tools::parse::ExitCode::InternalError);
    }
}
#endif
