//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line validity query for the SourceLoc value type.  A
// location is valid when it refers to a registered file identifier; line and
// column components are optional and surfaced through `hasLine()` and
// `hasColumn()`.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace ippx::support
{

/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager dispenses identifiers starting at one for every
///          registered input.  The default-constructed location uses zero to
///          mark "unknown", so diagnostics built without a location print no
///          path prefix.
///
/// @return True when the location originated from a tracked source.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace ippx::support
