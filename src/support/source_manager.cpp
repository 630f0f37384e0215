//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.cpp
// Purpose: Assigns stable identifiers to source and artifact paths.
// Key invariants: Paths are stored in lexically normalised generic form.
// Ownership/Lifetime: See source_manager.hpp.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include <filesystem>
#include <limits>

namespace fusion::support
{
namespace
{
std::string normalizePath(std::string path)
{
    return std::filesystem::path(std::move(path)).lexically_normal().generic_string();
}
} // namespace

uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));
    if (auto it = ids_.find(normalized); it != ids_.end())
        return it->second;

    if (files_.size() >= std::numeric_limits<uint32_t>::max() - 1)
        return 0;

    files_.push_back(std::move(normalized));
    const auto id = static_cast<uint32_t>(files_.size());
    ids_.emplace(files_.back(), id);
    return id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

} // namespace fusion::support
