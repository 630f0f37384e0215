//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/ArtifactCache.cpp
// Purpose: Insert-if-absent program cache.
// Key invariants: See ArtifactCache.hpp.
// Ownership/Lifetime: See ArtifactCache.hpp.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include "frontends/lf/ArtifactCache.hpp"

namespace fusion::frontends::lf
{

std::shared_ptr<const Program> ArtifactCache::find(const std::string &sourceHash) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(sourceHash);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<const Program> ArtifactCache::insert(Program program)
{
    auto entry = std::make_shared<const Program>(std::move(program));
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.emplace(entry->sourceHash, entry).first->second;
}

size_t ArtifactCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace fusion::frontends::lf
