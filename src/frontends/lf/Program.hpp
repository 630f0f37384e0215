//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/Program.hpp
// Purpose: In-memory representation of a compiled fusion source (the IR).
// Key invariants:
//   - blocks keep source order; that order is the execution order.
//   - directives keep every occurrence, duplicates included, in declaration
//     order per name.
//   - Equality ignores parseTime.
// Ownership/Lifetime: Program owns all directive and block storage.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/LanguageTag.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fusion::frontends::lf
{

/// @brief `#name "value"` line.
struct Directive
{
    std::string name;
    std::string value;
    uint32_t line = 0;

    bool operator==(const Directive &) const = default;
};

/// @brief One physical source line that contributed to a block.
struct Fragment
{
    uint32_t line = 0;
    std::string text; ///< Physical line with trailing whitespace removed.

    bool operator==(const Fragment &) const = default;
};

/// @brief Logical guest-language snippet assembled from one or more lines.
struct CodeBlock
{
    uint32_t line = 0;                ///< First physical line.
    LanguageTag tag = LanguageTag::Py;
    std::string content;              ///< Snippet with relative indentation.
    std::vector<Fragment> fragments;  ///< Contributing physical lines.

    bool operator==(const CodeBlock &) const = default;
};

struct ProgramStats
{
    size_t totalLines = 0;
    size_t directiveCount = 0;
    size_t codeBlockCount = 0;

    bool operator==(const ProgramStats &) const = default;
};

/// @brief Directive name used for module preloading.
inline constexpr std::string_view kNativeImportDirective = "native_import";

/// @brief Parsed and assembled fusion program.
struct Program
{
    std::map<std::string, std::vector<Directive>> directives;
    std::vector<CodeBlock> blocks;
    std::string sourceHash;
    ProgramStats stats;
    double parseTime = 0.0; ///< Seconds spent parsing; informational only.

    /// @brief First directive named @p name, or nullptr.
    const Directive *firstDirective(std::string_view name) const;

    /// @brief Every directive ordered by source line.
    std::vector<Directive> directivesInOrder() const;

    /// @brief native_import values, deduplicated, in declaration order.
    std::vector<std::string> nativeImports() const;

    /// @brief Digest over every block's line, tag and content.
    std::string blockDigest() const;

    bool operator==(const Program &other) const;
};

} // namespace fusion::frontends::lf
