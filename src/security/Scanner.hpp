//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: security/Scanner.hpp
// Purpose: Classify every block and directive of a program against a rule
//          set, producing a SecurityReport.
// Key invariants: scan() is pure and deterministic: it never executes guest
//                 code and depends only on its inputs.
// Ownership/Lifetime: A Scanner owns a copy of its rules.
// Links: docs/security.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/Program.hpp"
#include "security/Rules.hpp"
#include "security/SecurityReport.hpp"

namespace fusion::security
{

class Scanner
{
  public:
    explicit Scanner(RuleSet rules = RuleSet::defaults());

    /// @brief Scan @p program and judge its findings at @p level.
    SecurityReport scan(const frontends::lf::Program &program, SecurityLevel level) const;

    const RuleSet &rules() const
    {
        return rules_;
    }

  private:
    RuleSet rules_;
};

/// @brief Scan with the built-in rule catalogue.
SecurityReport scan(const frontends::lf::Program &program, SecurityLevel level);

} // namespace fusion::security
