//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares manager for source file identifiers.
// Key invariants: File ID 0 is invalid.
// Ownership/Lifetime: Manager owns file path strings.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ippx::support
{

/// @brief Pseudo path under which standard input is registered.
inline constexpr std::string_view kStdinPath = "<stdin>";

/// @brief Maintains the mapping between numeric file identifiers and the
///        names of the inputs they describe.
/// @invariant File id 0 is invalid.
class SourceManager
{
  public:
    /// @brief Register input named @p path and return its id.
    /// @param path File system path or pseudo path such as "<stdin>".
    /// @return New or previously assigned identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return Path string view; empty when the identifier is unknown.
    std::string_view getPath(uint32_t file_id) const;

  private:
    /// Stored paths. Index i holds the path of file id i + 1.
    /// std::deque keeps string references stable as new files are added.
    std::deque<std::string> files_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};

} // namespace ippx::support
