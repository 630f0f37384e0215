//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: security/Scanner.cpp
// Purpose: Textual and structural scanning of fusion programs.
// Key invariants: Each pattern rule reports at most once per block (its
//                 first match); a structural hit already reported by a
//                 pattern rule of the same capability on the same line is
//                 not repeated.
// Ownership/Lifetime: See Scanner.hpp.
// Links: docs/security.md
//
//===----------------------------------------------------------------------===//

#include "security/Scanner.hpp"

#include "frontends/py/Parser.hpp"
#include "security/AstAudit.hpp"
#include "support/diagnostics.hpp"

#include <algorithm>

namespace fusion::security
{

using frontends::lf::CodeBlock;
using frontends::lf::LanguageTag;
using frontends::lf::Program;

namespace
{

uint32_t lineOfOffset(const CodeBlock &block, size_t offset)
{
    const auto rel = static_cast<uint32_t>(std::count(block.content.begin(),
                                                      block.content.begin() + static_cast<std::ptrdiff_t>(offset), '\n'));
    return block.line + rel;
}

SecurityFinding makeFinding(const Rule &rule, std::optional<size_t> block, uint32_t line,
                            std::optional<LanguageTag> language, const std::string &detail)
{
    SecurityFinding f;
    f.block = block;
    f.line = line;
    f.language = language;
    f.severity = rule.severity;
    f.ruleId = rule.id;
    f.message = detail.empty() ? rule.message : rule.message + " (" + detail + ")";
    return f;
}

} // namespace

Scanner::Scanner(RuleSet rules) : rules_(std::move(rules)) {}

SecurityReport Scanner::scan(const Program &program, SecurityLevel level) const
{
    SecurityReport report(level);

    if (const Rule *rule = rules_.directiveRule())
    {
        for (const auto &d : program.directivesInOrder())
        {
            if (d.name == frontends::lf::kNativeImportDirective && isRestrictedModule(d.value))
                report.add(makeFinding(*rule, std::nullopt, d.line, std::nullopt, d.value));
        }
    }

    AstAudit audit;
    for (size_t i = 0; i < program.blocks.size(); ++i)
    {
        const CodeBlock &block = program.blocks[i];
        std::vector<std::pair<SecurityFinding, Capability>> found;

        for (const Rule *rule : rules_.patternRules(block.tag))
        {
            std::smatch m;
            if (std::regex_search(block.content, m, *rule->regex))
            {
                const uint32_t line = lineOfOffset(block, static_cast<size_t>(m.position(0)));
                found.emplace_back(makeFinding(*rule, i, line, block.tag, m.str(0)), rule->capability);
            }
        }

        if (frontends::lf::isNative(block.tag))
        {
            support::DiagnosticEngine diag;
            auto module = frontends::py::parseNativeSource(block.content, 0, block.line, diag);
            if (!module)
            {
                if (const Rule *rule = rules_.structuralRule(Capability::ParseError))
                {
                    uint32_t line = block.line;
                    std::string detail;
                    if (!diag.diagnostics().empty())
                    {
                        line = std::max(block.line, diag.diagnostics().front().loc.line);
                        detail = diag.diagnostics().front().message;
                    }
                    found.emplace_back(makeFinding(*rule, i, line, block.tag, detail), Capability::ParseError);
                }
            }
            else
            {
                for (const auto &hit : audit.audit(*module))
                {
                    const Rule *rule = rules_.structuralRule(hit.capability);
                    if (!rule)
                        continue;
                    const bool duplicate =
                        std::any_of(found.begin(), found.end(), [&](const auto &entry) {
                            return entry.second == hit.capability && entry.first.line == hit.line;
                        });
                    if (!duplicate)
                        found.emplace_back(makeFinding(*rule, i, hit.line, block.tag, hit.symbol), hit.capability);
                }
            }
        }

        std::stable_sort(found.begin(), found.end(),
                         [](const auto &a, const auto &b) { return a.first.line < b.first.line; });
        for (auto &entry : found)
            report.add(std::move(entry.first));
    }
    return report;
}

SecurityReport scan(const Program &program, SecurityLevel level)
{
    static const Scanner scanner;
    return scanner.scan(program, level);
}

} // namespace fusion::security
