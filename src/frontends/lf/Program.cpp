//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/Program.cpp
// Purpose: Query helpers over the program IR.
// Key invariants: blockDigest() depends only on block line, tag and content.
// Ownership/Lifetime: See Program.hpp.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#include "frontends/lf/Program.hpp"

#include "support/sha256.hpp"

#include <algorithm>
#include <set>

namespace fusion::frontends::lf
{

const Directive *Program::firstDirective(std::string_view name) const
{
    auto it = directives.find(std::string(name));
    if (it == directives.end() || it->second.empty())
        return nullptr;
    return &it->second.front();
}

std::vector<Directive> Program::directivesInOrder() const
{
    std::vector<Directive> all;
    for (const auto &[name, list] : directives)
        all.insert(all.end(), list.begin(), list.end());
    std::stable_sort(all.begin(), all.end(),
                     [](const Directive &a, const Directive &b) { return a.line < b.line; });
    return all;
}

std::vector<std::string> Program::nativeImports() const
{
    std::vector<std::string> modules;
    auto it = directives.find(std::string(kNativeImportDirective));
    if (it == directives.end())
        return modules;

    std::set<std::string> seen;
    for (const auto &d : it->second)
    {
        if (seen.insert(d.value).second)
            modules.push_back(d.value);
    }
    return modules;
}

std::string Program::blockDigest() const
{
    support::Sha256 h;
    for (const auto &b : blocks)
    {
        h.update(std::to_string(b.line));
        h.update(std::string_view("\x1f", 1));
        h.update(toString(b.tag));
        h.update(std::string_view("\x1f", 1));
        h.update(b.content);
        h.update(std::string_view("\x1e", 1));
    }
    return h.finishHex();
}

bool Program::operator==(const Program &other) const
{
    return directives == other.directives && blocks == other.blocks &&
           sourceHash == other.sourceHash && stats == other.stats;
}

} // namespace fusion::frontends::lf
