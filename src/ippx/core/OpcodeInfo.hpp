// File: src/ippx/core/OpcodeInfo.hpp
// Purpose: Declares the instruction signature table describing operand arity and categories.
// Key invariants: Table entries cover every Opcode enumerator exactly once.
// Ownership/Lifetime: Metadata is static storage duration and read-only.
// Links: docs/ippcode24.md#instructions
#pragma once

#include "ippx/core/Opcode.hpp"
#include "ippx/core/Operand.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace ippx::core
{

/// @brief Maximum number of operands any instruction accepts.
inline constexpr size_t kMaxOperands = 3;

/// @brief Static description of an opcode signature.
struct OpcodeInfo
{
    const char *name;    ///< Canonical upper-case mnemonic.
    uint8_t numOperands; ///< Exact operand count.
    std::array<OperandCategory, kMaxOperands> operands; ///< Categories; only the first numOperands are meaningful.
};

/// @brief Metadata table indexed by @c Opcode enumerators.
extern const std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable;

/// @brief Access metadata for a specific opcode.
/// @param op Opcode to query.
/// @return Reference to the metadata entry for @p op.
const OpcodeInfo &getOpcodeInfo(Opcode op);

/// @brief Resolve a mnemonic to its opcode, ignoring ASCII case.
/// @param mnemonic Token spelled in any letter case.
/// @return Opcode when the mnemonic names an instruction; std::nullopt otherwise.
std::optional<Opcode> lookupOpcode(std::string_view mnemonic);

/// @brief Enumerate every opcode in declaration order.
std::vector<Opcode> all_opcodes();

} // namespace ippx::core
