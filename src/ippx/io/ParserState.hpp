// File: src/ippx/io/ParserState.hpp
// Purpose: Declares the per-run parse context shared by the instruction parser helpers.
// Key invariants: Declared-variable sets only grow; nextOrder starts at 1 and
//                 advances once per accepted instruction.
// Ownership/Lifetime: Owned by one Parser::parse call and discarded afterwards.
// Links: docs/ippcode24.md#variables
#pragma once

#include "ippx/core/Operand.hpp"
#include "ippx/io/ParserOptions.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>

namespace ippx::io::detail
{

/// @brief Names introduced by DEFVAR, tracked per frame.
/// @details Only the global and local frames are tracked; temporary-frame
///          variables are presumed valid wherever they are used.
class DeclaredVariables
{
  public:
    /// @brief True when @p name was declared in @p frame, or @p frame is TF.
    [[nodiscard]] bool isDeclared(core::Frame frame, std::string_view name) const;

    /// @brief Record @p name in @p frame.
    /// @return False when the name was already present in a tracked frame.
    bool declare(core::Frame frame, std::string_view name);

  private:
    std::unordered_set<std::string> global_;
    std::unordered_set<std::string> local_;
};

/// @brief Mutable state threaded through one parse of a source program.
struct ParserState
{
    /// @brief Bind the state to caller-owned options and a source file id.
    ParserState(const ParserOptions &opts, uint32_t fileId);

    const ParserOptions &opts;

    /// SourceManager identifier of the input.
    uint32_t fileId = 0;

    /// Physical line currently being parsed.
    uint32_t lineNo = 0;

    /// Order number handed to the next accepted instruction.
    uint32_t nextOrder = 1;

    DeclaredVariables vars;
};

} // namespace ippx::io::detail
