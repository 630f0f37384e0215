//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic record and the engine that accumulates
//          diagnostics across compile, scan and run phases.
// Key invariants: Counts reflect the diagnostics reported so far; report
//                 order is preserved.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace fusion::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message with location and category.
struct Diagnostic
{
    Severity severity;                ///< Message severity
    std::string message;              ///< Human-readable text
    SourceLoc loc;                    ///< Optional source location
    std::string code;                 ///< Category such as "SyntaxError"; may be empty
    std::optional<std::size_t> block; ///< Index of the code block involved, if any
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Record every diagnostic held by @p other, preserving order.
    void append(const DiagnosticEngine &other);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param sm Optional source manager for resolving file identifiers.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    /// @brief Diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

} // namespace fusion::support
