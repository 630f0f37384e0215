//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/Directives.hpp
// Purpose: Validates and accumulates `#name "value"` directives.
// Key invariants:
//   - Unknown names are accepted with a warning.
//   - Duplicates are kept; deduplication happens at use sites.
//   - `python_import` is stored under `native_import`.
// Ownership/Lifetime: The processor borrows the diagnostic engine.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/Program.hpp"
#include "frontends/lf/Tokenizer.hpp"
#include "support/diag_expected.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fusion::frontends::lf
{

/// @brief True for directive names the toolchain interprets.
bool isKnownDirective(std::string_view name);

/// @brief True for values usable as a dotted module path.
bool isValidModulePath(std::string_view value);

class DirectiveProcessor
{
  public:
    DirectiveProcessor(support::DiagnosticEngine &diags, uint32_t fileId);

    /// @brief Record directive line @p line.
    /// @return SyntaxError when a native_import value is not a module path.
    support::Expected<void> add(const SourceLine &line);

    /// @brief Number of directives recorded so far.
    size_t count() const
    {
        return count_;
    }

    /// @brief Hand over the accumulated table.
    std::map<std::string, std::vector<Directive>> take();

  private:
    support::DiagnosticEngine &diags_;
    uint32_t fileId_;
    std::map<std::string, std::vector<Directive>> table_;
    size_t count_ = 0;
};

} // namespace fusion::frontends::lf
