//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the XmlSerializer class, which renders a validated
// Program as the XML document consumed by the IPPcode24 interpreter.
//
// Document shape:
//   <?xml version="1.0" encoding="UTF-8"?>
//   <program language="IPPcode24">
//     <instruction order="1" opcode="MOVE">
//       <arg1 type="var">GF@x</arg1>
//       <arg2 type="int">42</arg2>
//     </instruction>
//   </program>
//
// Design Decisions:
// - Stateless: No persistent state between write calls
// - Static methods: No need to instantiate XmlSerializer objects
// - Stream-based: Output to std::ostream (files, strings, stdout)
// - Format control: Pretty mode indents with tabs; Canonical mode emits the
//   whole program on one line after the XML declaration
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ippx/core/Program.hpp"

#include <ostream>
#include <string>

namespace ippx::io
{

/// @brief Serializes programs to their XML form.
class XmlSerializer
{
  public:
    /// @brief Controls output formatting style.
    enum class Mode
    {
        Pretty,
        Canonical
    };

    /// @brief Write program @p p to output stream @p os.
    /// @param p Program to serialize.
    /// @param os Destination stream.
    /// @param mode Formatting mode (pretty by default).
    static void write(const core::Program &p, std::ostream &os, Mode mode = Mode::Pretty);

    /// @brief Serialize program @p p to a string.
    /// @param p Program to serialize.
    /// @param mode Formatting mode (pretty by default).
    /// @return XML document text.
    static std::string toString(const core::Program &p, Mode mode = Mode::Pretty);
};

} // namespace ippx::io
