//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: security/SecurityReport.cpp
// Purpose: Verdict computation and text rendering of scan results.
// Key invariants: Rendering is deterministic for a given report.
// Ownership/Lifetime: See SecurityReport.hpp.
// Links: docs/security.md
//
//===----------------------------------------------------------------------===//

#include "security/SecurityReport.hpp"

#include <algorithm>

namespace fusion::security
{

void SecurityReport::add(SecurityFinding finding)
{
    findings_.push_back(std::move(finding));
}

bool SecurityReport::blocked() const
{
    return std::any_of(findings_.begin(), findings_.end(),
                       [this](const SecurityFinding &f) { return blocks(f.severity, level_); });
}

std::vector<const SecurityFinding *> SecurityReport::blocking() const
{
    std::vector<const SecurityFinding *> out;
    for (const auto &f : findings_)
    {
        if (blocks(f.severity, level_))
            out.push_back(&f);
    }
    return out;
}

size_t SecurityReport::count(Severity s) const
{
    return static_cast<size_t>(
        std::count_if(findings_.begin(), findings_.end(), [s](const SecurityFinding &f) { return f.severity == s; }));
}

void SecurityReport::render(std::ostream &os) const
{
    os << "security level: " << toString(level_) << " (blocks at " << toString(threshold()) << " and above)\n";
    if (findings_.empty())
    {
        os << "no findings\n";
    }
    for (const auto &f : findings_)
    {
        os << "  line " << f.line << ": ";
        if (f.block)
            os << "block " << *f.block;
        else
            os << "directive";
        if (f.language)
            os << " [" << frontends::lf::toString(*f.language) << "]";
        os << " " << toString(f.severity) << " " << f.ruleId << ": " << f.message;
        if (blocks(f.severity, level_))
            os << " (blocking)";
        os << '\n';
    }
    os << "findings: " << findings_.size() << " (critical " << count(Severity::Critical) << ", high "
       << count(Severity::High) << ", medium " << count(Severity::Medium) << ", low " << count(Severity::Low)
       << ")\n";
    os << "verdict: " << (blocked() ? "blocked" : "allowed") << '\n';
}

} // namespace fusion::security
