//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/ArtifactCache.hpp
// Purpose: Append-only cache of compiled programs keyed by source hash.
// Key invariants:
//   - Entries are never replaced or removed; the first insert for a hash wins.
//   - Cached programs are immutable and shared.
// Ownership/Lifetime: The cache shares ownership of every stored Program.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/Program.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fusion::frontends::lf
{

class ArtifactCache
{
  public:
    /// @brief Program cached under @p sourceHash, or nullptr.
    std::shared_ptr<const Program> find(const std::string &sourceHash) const;

    /// @brief Insert @p program unless its hash is already present.
    /// @return The cached entry, which is the earlier one when a race lost.
    std::shared_ptr<const Program> insert(Program program);

    size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const Program>> entries_;
};

} // namespace fusion::frontends::lf
