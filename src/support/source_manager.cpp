//===----------------------------------------------------------------------===//
//
// Part of the ippx project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager utility responsible for tracking the inputs
// referenced by diagnostics.  The manager assigns stable numeric identifiers
// to paths and resolves those identifiers back to strings when printing.
//
//===----------------------------------------------------------------------===//

#include "source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace ippx::support
{
namespace
{
/// @brief Normalise real paths; pseudo paths such as "<stdin>" pass through.
std::string normalizePath(std::string path)
{
    if (!path.empty() && path.front() == '<')
        return path;
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register @p path and hand out a stable identifier.
///
/// @details Re-registering the same normalised path returns the identifier
///          assigned the first time.  When the 32-bit identifier space is
///          exhausted an error diagnostic is printed and zero is returned so
///          callers can refuse to continue.
///
/// @param path Path or pseudo path of the input.
/// @return Identifier greater than zero, or zero on overflow.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));
    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, "source manager exhausted file identifier space");
        printDiag(diag, std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

} // namespace ippx::support
