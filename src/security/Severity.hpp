//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: security/Severity.hpp
// Purpose: Finding severities, scanner levels and the level-to-threshold map.
// Key invariants: Severities are totally ordered low < medium < high <
//                 critical; a stricter level never has a higher threshold.
// Ownership/Lifetime: Plain value types.
// Links: docs/security.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fusion::security
{

enum class Severity : uint8_t
{
    Low,
    Medium,
    High,
    Critical,
};

/// @brief Configured strictness of the scanner.
enum class SecurityLevel : uint8_t
{
    Low,
    Medium,
    High,
    Strict,
};

constexpr std::string_view toString(Severity s)
{
    switch (s)
    {
        case Severity::Low:
            return "low";
        case Severity::Medium:
            return "medium";
        case Severity::High:
            return "high";
        case Severity::Critical:
            return "critical";
    }
    return "?";
}

constexpr std::string_view toString(SecurityLevel l)
{
    switch (l)
    {
        case SecurityLevel::Low:
            return "low";
        case SecurityLevel::Medium:
            return "medium";
        case SecurityLevel::High:
            return "high";
        case SecurityLevel::Strict:
            return "strict";
    }
    return "?";
}

/// @brief Lowest severity that blocks execution at level @p l.
constexpr Severity blockingThreshold(SecurityLevel l)
{
    switch (l)
    {
        case SecurityLevel::Low:
            return Severity::Critical;
        case SecurityLevel::Medium:
            return Severity::High;
        case SecurityLevel::High:
            return Severity::Medium;
        case SecurityLevel::Strict:
            return Severity::Low;
    }
    return Severity::Low;
}

/// @brief Whether a finding of severity @p s blocks at level @p l.
constexpr bool blocks(Severity s, SecurityLevel l)
{
    return s >= blockingThreshold(l);
}

std::optional<Severity> parseSeverity(std::string_view text);

std::optional<SecurityLevel> parseSecurityLevel(std::string_view text);

} // namespace fusion::security
