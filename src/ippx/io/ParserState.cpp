//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ippx/io/ParserState.cpp
// Purpose: Define the parse context and the declared-variable sets used to
//          detect variables referenced before their DEFVAR.
// Ownership/Lifetime: ParserState keeps a reference to caller-owned options.
// Links: docs/ippcode24.md#variables
//
//===----------------------------------------------------------------------===//

#include "ippx/io/ParserState.hpp"

namespace ippx::io::detail
{

bool DeclaredVariables::isDeclared(core::Frame frame, std::string_view name) const
{
    switch (frame)
    {
        case core::Frame::Global:
            return global_.count(std::string(name)) != 0;
        case core::Frame::Local:
            return local_.count(std::string(name)) != 0;
        case core::Frame::Temporary:
            return true;
    }
    return false;
}

/// @brief Record a DEFVAR.
///
/// GF and LF are independent namespaces, so the same name may be declared in
/// both.  TF declarations are accepted without being tracked.
bool DeclaredVariables::declare(core::Frame frame, std::string_view name)
{
    switch (frame)
    {
        case core::Frame::Global:
            return global_.emplace(name).second;
        case core::Frame::Local:
            return local_.emplace(name).second;
        case core::Frame::Temporary:
            return true;
    }
    return true;
}

/// @brief Bind the parse context to the caller's options.
///
/// The options are captured by reference; the caller keeps them alive for the
/// duration of the parse.
ParserState::ParserState(const ParserOptions &opts, uint32_t fileId) : opts(opts), fileId(fileId) {}

} // namespace ippx::io::detail
