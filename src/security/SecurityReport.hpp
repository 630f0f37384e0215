//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: security/SecurityReport.hpp
// Purpose: Findings produced by the scanner and the verdict they imply.
// Key invariants: Findings are ordered by block index, then by line, with
//                 directive findings first; the verdict is derived from the
//                 findings and the level, never stored separately.
// Ownership/Lifetime: Plain value types.
// Links: docs/security.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/LanguageTag.hpp"
#include "security/Severity.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace fusion::security
{

struct SecurityFinding
{
    std::optional<size_t> block; ///< Empty for directive findings.
    uint32_t line = 0;
    std::optional<frontends::lf::LanguageTag> language;
    Severity severity = Severity::Low;
    std::string ruleId;
    std::string message;

    bool operator==(const SecurityFinding &) const = default;
};

/// @brief Outcome of scanning one program at one level.
class SecurityReport
{
  public:
    SecurityReport() = default;

    explicit SecurityReport(SecurityLevel level) : level_(level) {}

    void add(SecurityFinding finding);

    SecurityLevel level() const
    {
        return level_;
    }

    Severity threshold() const
    {
        return blockingThreshold(level_);
    }

    const std::vector<SecurityFinding> &findings() const
    {
        return findings_;
    }

    /// @brief True when at least one finding meets the threshold.
    bool blocked() const;

    /// @brief Findings that meet the threshold, in report order.
    std::vector<const SecurityFinding *> blocking() const;

    size_t count(Severity s) const;

    /// @brief Human-readable rendering used by `lfc analyze`.
    void render(std::ostream &os) const;

  private:
    SecurityLevel level_ = SecurityLevel::Medium;
    std::vector<SecurityFinding> findings_;
};

} // namespace fusion::security
