//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the routine powering the `ippx-parse` CLI.  The entry point is
// factored into a separate unit so tests can drive the whole tool with string
// streams and a preconfigured SourceManager without spawning a process.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Exposes the reusable translation pipeline behind `ippx-parse`.

#pragma once

#include "support/source_manager.hpp"

#include <iosfwd>

namespace ippx::tools::parse
{

/// @brief Execute the ippx-parse workflow with injectable streams.
/// @param argc Argument count including the program name.
/// @param argv Argument vector.
/// @param in Stream supplying the IPPcode24 source.
/// @param out Stream receiving the XML document or usage text.
/// @param err Stream receiving diagnostics.
/// @param sm Source manager used to label diagnostic locations.
/// @return Process exit status (see ExitCode).
int runCLI(int argc,
           char **argv,
           std::istream &in,
           std::ostream &out,
           std::ostream &err,
           ippx::support::SourceManager &sm);

} // namespace ippx::tools::parse
