//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source location value attached to diagnostics.
// Key invariants: file_id == 0 denotes an unregistered file; line/column are
//                 1-based when known and 0 when unknown.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace fusion::support
{

/// @brief Position inside a fusion source or artifact.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 when no file is attached.
    uint32_t file_id = 0;

    /// @brief One-based physical line; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column; 0 when unknown.
    uint32_t column = 0;

    [[nodiscard]] bool hasFile() const
    {
        return file_id != 0;
    }

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    /// @brief Build a location that only carries a line number.
    static SourceLoc atLine(uint32_t file, uint32_t line)
    {
        return SourceLoc{file, line, 0};
    }
};

} // namespace fusion::support
