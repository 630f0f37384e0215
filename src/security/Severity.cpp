//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: security/Severity.cpp
// Purpose: Parsing of severity and level spellings.
// Key invariants: Parsing is case-sensitive and accepts exactly the
//                 spellings produced by toString.
// Ownership/Lifetime: Stateless.
// Links: docs/security.md
//
//===----------------------------------------------------------------------===//

#include "security/Severity.hpp"

#include <array>

namespace fusion::security
{

std::optional<Severity> parseSeverity(std::string_view text)
{
    constexpr std::array<Severity, 4> all = {Severity::Low, Severity::Medium, Severity::High, Severity::Critical};
    for (Severity s : all)
    {
        if (toString(s) == text)
            return s;
    }
    return std::nullopt;
}

std::optional<SecurityLevel> parseSecurityLevel(std::string_view text)
{
    constexpr std::array<SecurityLevel, 4> all = {
        SecurityLevel::Low, SecurityLevel::Medium, SecurityLevel::High, SecurityLevel::Strict};
    for (SecurityLevel l : all)
    {
        if (toString(l) == text)
            return l;
    }
    return std::nullopt;
}

} // namespace fusion::security
