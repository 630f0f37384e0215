//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: security/Rules.hpp
// Purpose: Denylist rules per guest language plus the structural rules used
//          by the native audit.
// Key invariants: Rule ids are unique; within a language rules keep their
//                 registration order, which is the order findings appear in.
// Ownership/Lifetime: A RuleSet owns its rules and their compiled patterns;
//                     copies share the immutable compiled regexes.
// Links: docs/security.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/LanguageTag.hpp"
#include "security/Severity.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace fusion::security
{

using frontends::lf::LanguageTag;

/// @brief What a dangerous construct would let guest code do.
enum class Capability : uint8_t
{
    ProcessSpawn,
    DynamicEval,
    FileWrite,
    FilesystemDestroy,
    Network,
    Deserialize,
    NativeMemory,
    RestrictedImport,
    ParseError,
};

std::string_view toString(Capability c);

/// @brief How a rule is matched.
enum class RuleKind : uint8_t
{
    Pattern,    ///< Regular expression over block content.
    Structural, ///< Fired by the native syntax-tree audit.
    Directive,  ///< Applies to `native_import` directive values.
};

struct Rule
{
    std::string id;
    RuleKind kind = RuleKind::Pattern;
    std::optional<LanguageTag> language; ///< Empty for directive rules.
    Capability capability = Capability::ProcessSpawn;
    Severity severity = Severity::High;
    std::string message;
    std::string pattern;                      ///< Source of the regex; Pattern rules only.
    std::shared_ptr<const std::regex> regex;  ///< Compiled pattern; Pattern rules only.
    bool enabled = true;
};

/// @brief Ordered, overridable collection of rules.
class RuleSet
{
  public:
    /// @brief The built-in rule catalogue.
    static RuleSet defaults();

    /// @brief Register a textual rule; throws std::regex_error for a bad pattern.
    void addPattern(std::string id,
                    LanguageTag language,
                    Capability capability,
                    Severity severity,
                    std::string pattern,
                    std::string message);

    /// @brief Register a rule fired by the structural audit or by directives.
    void addRule(Rule rule);

    /// @brief Change the severity of rule @p id, or disable it when
    ///        @p severity is empty.
    /// @return False when no rule has that id.
    bool override(std::string_view id, std::optional<Severity> severity);

    const Rule *find(std::string_view id) const;

    /// @brief Enabled pattern rules for @p language in registration order.
    std::vector<const Rule *> patternRules(LanguageTag language) const;

    /// @brief Enabled structural rule reporting @p capability, or nullptr.
    const Rule *structuralRule(Capability capability) const;

    /// @brief Enabled directive rule, or nullptr.
    const Rule *directiveRule() const;

    const std::vector<Rule> &rules() const
    {
        return rules_;
    }

  private:
    std::vector<Rule> rules_;
};

/// @brief Top-level native modules whose import is reported.
bool isRestrictedModule(std::string_view dottedName);

} // namespace fusion::security
