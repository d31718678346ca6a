// File: src/tools/ippx-parse/cli.hpp
// Purpose: Declarations for ippx-parse argument parsing and usage text.
// Key invariants: Only -h/--help is recognised.
// Ownership/Lifetime: N/A.
// Links: docs/codemap.md
#pragma once

#include "tools/common/ArgvView.hpp"

#include <ostream>
#include <string>

namespace ippx::tools::parse
{

/// @brief Outcome of command-line parsing.
enum class CliStatus
{
    Run,  ///< Translate standard input.
    Help, ///< Print usage and exit successfully.
    Error ///< Unrecognised or misplaced argument.
};

/// @brief Result of parsing the command line.
struct CliResult
{
    CliStatus status = CliStatus::Run;

    /// @brief Offending argument when @ref status is Error.
    std::string offending;
};

/// @brief Parse the arguments following the program name.
/// @param args Arguments with argv[0] already dropped.
/// @return Requested action, or the first offending argument.
CliResult parseArgs(ArgvView args);

/// @brief Print the usage banner to @p os.
void printUsage(std::ostream &os);

} // namespace ippx::tools::parse
