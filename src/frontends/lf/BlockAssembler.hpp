//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/BlockAssembler.hpp
// Purpose: Folds consecutive tagged code lines into logical code blocks.
//
// A tagged line continues the open block when the previous line belonged to
// that block (same tag, nothing in between) and one of the following holds:
//   1. the block is still open: for indentation languages the last line ends
//      with ':' or '\', or a bracket is unclosed; for brace languages any of
//      '{', '(' or '[' is unclosed;
//   2. the line is indented strictly deeper than the block's first line;
//   3. indentation languages only: the block opened a compound statement and
//      the line starts with a clause keyword (elif, else, except, finally) at
//      the base indentation.
// Blank, comment and directive lines, and a change of tag, close the block.
//
// Key invariants: Block content keeps indentation relative to the first line.
// Ownership/Lifetime: Assembler owns the blocks until finish().
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/Program.hpp"
#include "frontends/lf/Tokenizer.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fusion::frontends::lf
{

/// @brief Running bracket/string state of a block being assembled.
struct NestingState
{
    int depth = 0;              ///< Unclosed (, [ and { across the block.
    bool trailingColon = false; ///< Last line ends with ':' (comments ignored).
    bool trailingBackslash = false;
    char openTriple = 0;        ///< Quote char of a triple-quoted string left open.

    /// @brief Fold @p code into the state using @p syntax lexical rules.
    void scan(std::string_view code, BlockSyntax syntax);

    /// @brief True when the next line must belong to the same block.
    bool isOpen(BlockSyntax syntax) const;
};

class BlockAssembler
{
  public:
    /// @brief Feed the next classified line.
    void feed(const SourceLine &line);

    /// @brief Close any open block and return all blocks in source order.
    std::vector<CodeBlock> finish();

  private:
    struct OpenBlock
    {
        LanguageTag tag = LanguageTag::Py;
        uint32_t line = 0;
        unsigned baseIndent = 0;
        bool compound = false;
        NestingState nesting;
        std::vector<std::pair<unsigned, std::string>> code; ///< (indent, text) per line.
        std::vector<Fragment> fragments;
    };

    bool continues(const OpenBlock &block, const SourceLine &line) const;
    void open(const SourceLine &line);
    void close();

    std::optional<OpenBlock> open_;
    std::vector<CodeBlock> blocks_;
};

/// @brief Assemble all code lines of @p lines into blocks.
std::vector<CodeBlock> assembleBlocks(const std::vector<SourceLine> &lines);

} // namespace fusion::frontends::lf
