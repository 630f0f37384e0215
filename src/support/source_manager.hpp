//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Maps file identifiers used in diagnostics back to paths.
// Key invariants: File id 0 is reserved; ids are assigned densely from 1 and a
//                 path registered twice receives the same id.
// Ownership/Lifetime: Owns the stored path strings.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fusion::support
{

/// @brief Registry of the files a compilation or run touched.
class SourceManager
{
  public:
    /// @brief Register @p path and return its identifier.
    /// @return Identifier greater than zero, or 0 when the id space is exhausted.
    uint32_t addFile(std::string path);

    /// @brief Path registered under @p file_id, or empty when unknown.
    std::string_view getPath(uint32_t file_id) const;

  private:
    std::deque<std::string> files_;
    std::unordered_map<std::string, uint32_t> ids_;
};

} // namespace fusion::support
