//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Defines the instruction signature table.  The entries are generated from
// Opcode.def and give the parser the exact operand count and the expected
// operand category of every slot.
//
//===----------------------------------------------------------------------===//

#include "ippx/core/OpcodeInfo.hpp"

#include <cctype>
#include <string>
#include <unordered_map>

namespace ippx::core
{

namespace
{
// Single-letter aliases used by the Opcode.def rows.
constexpr OperandCategory V = OperandCategory::Variable;
constexpr OperandCategory S = OperandCategory::Symbol;
constexpr OperandCategory L = OperandCategory::Label;
constexpr OperandCategory T = OperandCategory::Type;
// Unused slots are never read; any category serves as filler.
constexpr OperandCategory N = OperandCategory::Variable;

/// @brief Build the operand category array for an opcode definition.
constexpr std::array<OperandCategory, kMaxOperands> makeOperands(OperandCategory a,
                                                                 OperandCategory b,
                                                                 OperandCategory c)
{
    return {a, b, c};
}

/// @brief Upper-case ASCII letters of @p text.
std::string toUpperAscii(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (unsigned char ch : text)
        out.push_back(static_cast<char>(std::toupper(ch)));
    return out;
}

/// @brief Lazily build a lookup from upper-case mnemonics to Opcode enumerators.
const std::unordered_map<std::string, Opcode> &mnemonicTable()
{
    static const std::unordered_map<std::string, Opcode> table = []
    {
        std::unordered_map<std::string, Opcode> map;
        map.reserve(kNumOpcodes);
        for (size_t index = 0; index < kNumOpcodes; ++index)
            map.emplace(kOpcodeTable[index].name, static_cast<Opcode>(index));
        return map;
    }();
    return table;
}
} // namespace

const std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable = {{
#define IPPX_OPCODE(NAME, MNEMONIC, NUM_OPS, OP0, OP1, OP2)                                        \
    {MNEMONIC, NUM_OPS, makeOperands(OP0, OP1, OP2)},
#include "ippx/core/Opcode.def"
#undef IPPX_OPCODE
}};

static_assert(kOpcodeTable.size() == kNumOpcodes, "Opcode table must match enum count");

/// @brief Retrieve the metadata describing a specific opcode.
/// @param op Opcode whose metadata is required.
/// @return Reference to the immutable opcode descriptor.
const OpcodeInfo &getOpcodeInfo(Opcode op)
{
    return kOpcodeTable[static_cast<size_t>(op)];
}

/// @brief Resolve @p mnemonic against the signature table.
///
/// Mnemonics are case-insensitive in source text; the table stores the
/// canonical upper-case spelling, so the token is folded before lookup.
/// Unknown spellings yield std::nullopt rather than an error so the caller
/// decides how to report them.
std::optional<Opcode> lookupOpcode(std::string_view mnemonic)
{
    const auto &table = mnemonicTable();
    auto it = table.find(toUpperAscii(mnemonic));
    if (it == table.end())
        return std::nullopt;
    return it->second;
}

std::vector<Opcode> all_opcodes()
{
    std::vector<Opcode> ops;
    ops.reserve(kNumOpcodes);
    for (size_t index = 0; index < kNumOpcodes; ++index)
        ops.push_back(static_cast<Opcode>(index));
    return ops;
}

} // namespace ippx::core
