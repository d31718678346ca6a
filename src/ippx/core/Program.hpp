// File: src/ippx/core/Program.hpp
// Purpose: Declares the Program aggregate handed to the XML renderer.
// Key invariants: instructions are ordered by strictly increasing order numbers.
// Ownership/Lifetime: Program owns its instructions.
// Links: docs/ippcode24.md
#pragma once

#include "ippx/core/Instr.hpp"

#include <string>
#include <vector>

namespace ippx::core
{

/// @brief A fully validated source program.
struct Program
{
    /// Language name echoed into the `<program language>` attribute.
    std::string language;

    /// True once the mandatory header line was accepted.
    bool headerAccepted = false;

    /// Instructions in source order.
    std::vector<Instr> instructions;
};

} // namespace ippx::core
