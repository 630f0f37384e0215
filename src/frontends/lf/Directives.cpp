//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/Directives.cpp
// Purpose: Directive validation and storage.
// Key invariants: See Directives.hpp.
// Ownership/Lifetime: See Directives.hpp.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#include "frontends/lf/Directives.hpp"

#include <array>
#include <cctype>

namespace fusion::frontends::lf
{
namespace
{
constexpr std::array<std::string_view, 5> kKnownDirectives = {
    "name", "version", "author", "description", "native_import"};

constexpr std::string_view kLegacyImportDirective = "python_import";
} // namespace

bool isKnownDirective(std::string_view name)
{
    for (auto known : kKnownDirectives)
    {
        if (known == name)
            return true;
    }
    return name == kLegacyImportDirective;
}

bool isValidModulePath(std::string_view value)
{
    if (value.empty())
        return false;
    const auto first = static_cast<unsigned char>(value.front());
    if (!std::isalpha(first) && first != '_')
        return false;
    for (char c : value)
    {
        const auto u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '_' && c != '.')
            return false;
    }
    return true;
}

DirectiveProcessor::DirectiveProcessor(support::DiagnosticEngine &diags, uint32_t fileId)
    : diags_(diags), fileId_(fileId)
{
}

support::Expected<void> DirectiveProcessor::add(const SourceLine &line)
{
    const auto loc = support::SourceLoc::atLine(fileId_, line.line);
    std::string name = line.name;

    if (name == kLegacyImportDirective)
    {
        diags_.report({support::Severity::Note,
                       "'python_import' is treated as 'native_import'",
                       loc,
                       "Directive",
                       std::nullopt});
        name = std::string(kNativeImportDirective);
    }
    else if (!isKnownDirective(name))
    {
        diags_.report(support::makeWarning(
            "UnknownDirective", loc, "unknown directive '" + name + "' ignored by the toolchain"));
    }

    if (name == kNativeImportDirective && !isValidModulePath(line.value))
    {
        return support::makeError(
            "SyntaxError", loc, "invalid module name '" + line.value + "' in native_import");
    }

    table_[name].push_back(Directive{name, line.value, line.line});
    ++count_;
    return {};
}

std::map<std::string, std::vector<Directive>> DirectiveProcessor::take()
{
    count_ = 0;
    return std::move(table_);
}

} // namespace fusion::frontends::lf
