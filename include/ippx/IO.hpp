// File: include/ippx/IO.hpp
// Purpose: Stable façade for IPPcode24 parsing, XML serialization, and string utilities.
// Key invariants: Re-exports supported IO interfaces; parser internals stay internal.
// Ownership/Lifetime: Parser/XmlSerializer mirror underlying implementations.
// Links: docs/ippcode24.md
#pragma once

#include "ippx/io/Parser.hpp"
#include "ippx/io/ParserUtil.hpp"
#include "ippx/io/StringEscape.hpp"
#include "ippx/io/XmlSerializer.hpp"

/// @file include/ippx/IO.hpp
/// @brief Aggregated public header for IPPcode24 text IO.  Provides access to
///        the program parser, the XML serializer and the string escape helpers
///        while keeping the per-line parsing details under src/ippx/io.
