// File: src/ippx/core/Opcode.hpp
// Purpose: Enumerates IPPcode24 instruction opcodes.
// Key invariants: Enumeration order matches Opcode.def.
// Ownership/Lifetime: Not applicable.
// Links: docs/ippcode24.md#instructions
#pragma once

#include <cstddef>

namespace ippx::core
{

/// @brief All instruction opcodes defined by IPPcode24.
enum class Opcode
{
#define IPPX_OPCODE(NAME, ...) NAME,
#include "ippx/core/Opcode.def"
#undef IPPX_OPCODE
    Count
};

/// @brief Total number of opcodes defined by the language.
constexpr size_t kNumOpcodes = static_cast<size_t>(Opcode::Count);

/// @brief Convert opcode @p op to its canonical upper-case mnemonic.
/// @param op Opcode to stringify.
/// @return Mnemonic string; empty for out-of-range values.
const char *toString(Opcode op);

} // namespace ippx::core
