//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: security/AstAudit.hpp
// Purpose: Structural audit of native syntax trees: follows import aliases
//          and reports calls that reach dangerous capabilities.
// Key invariants: Alias chains are followed to at most kMaxAliasDepth links;
//                 the audit is flow-insensitive within a block and carries
//                 its alias table across blocks of one program.
// Ownership/Lifetime: Audits borrow the modules they walk only for the
//                     duration of audit().
// Links: docs/security.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/py/AST.hpp"
#include "security/Rules.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace fusion::security
{

/// @brief Longest alias chain the audit follows.
inline constexpr int kMaxAliasDepth = 4;

/// @brief A dangerous construct found in a native block.
struct StructuralHit
{
    uint32_t line = 0;
    Capability capability = Capability::ProcessSpawn;
    std::string symbol; ///< Resolved dotted name, e.g. "os.system".
};

/// @brief Alias-tracking walker over native modules.
class AstAudit
{
  public:
    /// @brief Walk @p module and return its hits in source order.
    std::vector<StructuralHit> audit(const frontends::py::Module &module);

    /// @brief Resolve a dotted name through the alias table; used by tests.
    std::string resolveName(const std::string &name) const;

  private:
    struct Alias
    {
        std::string target; ///< Fully qualified dotted path.
        int depth = 0;
    };

    class Walker;

    std::map<std::string, Alias> aliases_;
    std::set<std::string> starModules_;
};

/// @brief Capability reached by calling the fully qualified @p symbol.
std::optional<Capability> capabilityOf(std::string_view symbol);

} // namespace fusion::security
