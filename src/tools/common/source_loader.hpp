//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Read fusion sources and artifacts from disk and write artifacts back.
// Key invariants: Loaded buffers contain the complete file contents; files
//                 larger than kMaxSourceBytes are rejected.
// Ownership/Lifetime: Returned buffers are owned by the caller.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace fusion::tools::common
{

inline constexpr std::size_t kMaxSourceBytes = 64u * 1024u * 1024u;

/// @brief Load @p path into memory.
/// @return File contents, or an IOError diagnostic.
support::Expected<std::string> loadSourceFile(const std::string &path);

/// @brief Replace the contents of @p path with @p text.
/// @return IOError diagnostic when the file cannot be written.
support::Expected<void> writeTextFile(const std::string &path, std::string_view text);

} // namespace fusion::tools::common
