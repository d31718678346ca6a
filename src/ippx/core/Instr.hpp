// File: src/ippx/core/Instr.hpp
// Purpose: Declares the validated instruction record produced by the parser.
// Key invariants: operands.size() equals the opcode's signature arity; order is 1-based.
// Ownership/Lifetime: Instructions own their operands by value.
// Links: docs/ippcode24.md#instructions
#pragma once

#include "ippx/core/Opcode.hpp"
#include "ippx/core/Operand.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <vector>

namespace ippx::core
{

/// @brief Instruction validated against its signature.
struct Instr
{
    /// Opcode identifying the instruction.
    Opcode op = Opcode::Break;

    /// Classified operands in source order.
    std::vector<Operand> operands;

    /// Position among successfully parsed instructions, starting at 1.
    uint32_t order = 0;

    /// Location of the opcode token.
    ippx::support::SourceLoc loc{};

    /// @brief Canonical upper-case mnemonic of @ref op.
    [[nodiscard]] const char *mnemonic() const
    {
        return toString(op);
    }
};

} // namespace ippx::core
