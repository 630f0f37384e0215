//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/Tokenizer.hpp
// Purpose: Classifies the physical lines of a fusion source into blank,
//          comment, directive and tagged code lines.
// Key invariants:
//   - One SourceLine per physical line, in order, numbered from 1.
//   - Lines inside a multi-line /* */ comment classify as Comment.
//   - Code lines carry the indentation width measured before the tag plus
//     after the dot, with tabs counting four columns.
// Ownership/Lifetime: SourceLine values own their text.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/LanguageTag.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fusion::frontends::lf
{

enum class LineKind
{
    Blank,
    Comment,
    Directive,
    Code,
};

/// @brief Classified physical line.
struct SourceLine
{
    LineKind kind = LineKind::Blank;
    uint32_t line = 0;
    std::string raw; ///< Physical text with trailing whitespace removed.

    // Directive lines.
    std::string name;
    std::string value;

    // Code lines.
    LanguageTag tag = LanguageTag::Py;
    unsigned indent = 0;
    std::string code; ///< Text after the tag with leading whitespace removed.
};

/// @brief Width in columns of a tab when measuring indentation.
inline constexpr unsigned kTabWidth = 4;

/// @brief Split @p source into classified lines.
/// @param fileId Source manager id stamped on diagnostics.
/// @return Lines, or a SyntaxError / UnknownLanguageError diagnostic.
support::Expected<std::vector<SourceLine>> tokenize(std::string_view source, uint32_t fileId = 0);

/// @brief Split text on '\n', '\r\n' and '\r'.
std::vector<std::string_view> splitLines(std::string_view text);

} // namespace fusion::frontends::lf
