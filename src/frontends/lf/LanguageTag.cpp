//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/LanguageTag.cpp
// Purpose: Tag spelling lookup.
// Key invariants: Lookup is case-sensitive.
// Ownership/Lifetime: N/A.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#include "frontends/lf/LanguageTag.hpp"

namespace fusion::frontends::lf
{

std::optional<LanguageTag> parseLanguageTag(std::string_view text)
{
    for (LanguageTag tag : kAllLanguageTags)
    {
        if (toString(tag) == text)
            return tag;
    }
    return std::nullopt;
}

} // namespace fusion::frontends::lf
