//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the error-kind to exit-status lookup used by the ippx-parse
// driver.  The mapping is a single table so every kind has exactly one
// designated status.
//
//===----------------------------------------------------------------------===//

#include "tools/ippx-parse/exit_codes.hpp"

#include <array>
#include <utility>

namespace ippx::tools::parse
{
namespace
{
using core::ErrorKind;

constexpr std::array<std::pair<ErrorKind, ExitCode>, 11> kExitCodeTable = {{
    {ErrorKind::Header, ExitCode::HeaderError},
    {ErrorKind::UnknownOpcode, ExitCode::OpcodeError},
    {ErrorKind::Arity, ExitCode::SyntaxError},
    {ErrorKind::BadVariable, ExitCode::SyntaxError},
    {ErrorKind::BadLiteral, ExitCode::SyntaxError},
    {ErrorKind::BadLabel, ExitCode::SyntaxError},
    {ErrorKind::BadType, ExitCode::SyntaxError},
    {ErrorKind::UndeclaredVariable, ExitCode::SyntaxError},
    {ErrorKind::Redeclaration, ExitCode::SyntaxError},
    {ErrorKind::MultipleOpcode, ExitCode::SyntaxError},
    {ErrorKind::EmptyProgram, ExitCode::SyntaxError},
}};
} // namespace

ExitCode exitCodeFor(ErrorKind kind)
{
    for (const auto &[entryKind, code] : kExitCodeTable)
    {
        if (entryKind == kind)
            return code;
    }
    return ExitCode::InternalError;
}

} // namespace ippx::tools::parse
