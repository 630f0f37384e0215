//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/BlockAssembler.cpp
// Purpose: Block continuation state machine.
// Key invariants: See BlockAssembler.hpp.
// Ownership/Lifetime: See BlockAssembler.hpp.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#include "frontends/lf/BlockAssembler.hpp"

#include <array>

namespace fusion::frontends::lf
{
namespace
{
constexpr std::array<std::string_view, 4> kClauseKeywords = {"elif", "else", "except", "finally"};

bool startsWithClauseKeyword(std::string_view code)
{
    for (auto kw : kClauseKeywords)
    {
        if (code.substr(0, kw.size()) != kw)
            continue;
        if (code.size() == kw.size())
            return true;
        const char next = code[kw.size()];
        if (next == ':' || next == ' ' || next == '\t' || next == '(')
            return true;
    }
    return false;
}

/// @brief Does a '\'' at @p i start a character literal in a brace language?
bool isCharLiteral(std::string_view code, size_t i)
{
    for (size_t j = i + 1; j < code.size() && j <= i + 4; ++j)
    {
        if (code[j] == '\\')
        {
            ++j;
            continue;
        }
        if (code[j] == '\'')
            return true;
    }
    return false;
}
} // namespace

void NestingState::scan(std::string_view code, BlockSyntax syntax)
{
    char last = 0;
    size_t i = 0;

    if (openTriple != 0)
    {
        const std::string closing(3, openTriple);
        const size_t end = code.find(closing);
        if (end == std::string_view::npos)
        {
            trailingColon = false;
            trailingBackslash = false;
            return;
        }
        openTriple = 0;
        i = end + 3;
    }

    while (i < code.size())
    {
        const char c = code[i];
        if (syntax == BlockSyntax::Indentation && c == '#')
            break;
        if (syntax == BlockSyntax::Braces && c == '/' && i + 1 < code.size() && code[i + 1] == '/')
            break;

        const bool quote = c == '"' || c == '`' || (c == '\'' && (syntax == BlockSyntax::Indentation ||
                                                                  isCharLiteral(code, i)));
        if (quote)
        {
            if (syntax == BlockSyntax::Indentation && code.substr(i, 3) == std::string(3, c))
            {
                const size_t end = code.find(std::string(3, c), i + 3);
                if (end == std::string_view::npos)
                {
                    openTriple = c;
                    trailingColon = false;
                    trailingBackslash = false;
                    return;
                }
                i = end + 3;
                last = c;
                continue;
            }
            size_t j = i + 1;
            while (j < code.size() && code[j] != c)
                j += code[j] == '\\' ? 2 : 1;
            i = j + 1;
            last = c;
            continue;
        }

        if (c == '(' || c == '[' || c == '{')
            ++depth;
        else if ((c == ')' || c == ']' || c == '}') && depth > 0)
            --depth;
        if (c != ' ' && c != '\t')
            last = c;
        ++i;
    }

    trailingColon = last == ':';
    trailingBackslash = !code.empty() && code.back() == '\\';
}

bool NestingState::isOpen(BlockSyntax syntax) const
{
    if (depth > 0 || openTriple != 0)
        return true;
    if (syntax == BlockSyntax::Indentation)
        return trailingColon || trailingBackslash;
    return false;
}

bool BlockAssembler::continues(const OpenBlock &block, const SourceLine &line) const
{
    if (line.tag != block.tag)
        return false;

    const BlockSyntax syntax = blockSyntaxOf(block.tag);
    if (block.nesting.isOpen(syntax))
        return true;
    if (line.indent > block.baseIndent)
        return true;
    return syntax == BlockSyntax::Indentation && block.compound &&
           line.indent == block.baseIndent && startsWithClauseKeyword(line.code);
}

void BlockAssembler::open(const SourceLine &line)
{
    OpenBlock block;
    block.tag = line.tag;
    block.line = line.line;
    block.baseIndent = line.indent;
    open_ = std::move(block);
}

void BlockAssembler::feed(const SourceLine &line)
{
    if (line.kind != LineKind::Code)
    {
        close();
        return;
    }

    if (!open_ || !continues(*open_, line))
    {
        close();
        open(line);
    }

    OpenBlock &block = *open_;
    const BlockSyntax syntax = blockSyntaxOf(block.tag);
    block.nesting.scan(line.code, syntax);
    if (block.code.empty())
        block.compound = syntax == BlockSyntax::Indentation && block.nesting.trailingColon;
    block.code.emplace_back(line.indent, line.code);
    block.fragments.push_back(Fragment{line.line, line.raw});
}

void BlockAssembler::close()
{
    if (!open_)
        return;

    OpenBlock &block = *open_;
    CodeBlock out;
    out.line = block.line;
    out.tag = block.tag;
    out.fragments = std::move(block.fragments);

    for (size_t i = 0; i < block.code.size(); ++i)
    {
        const auto &[indent, text] = block.code[i];
        if (i != 0)
            out.content.push_back('\n');
        if (!text.empty() && indent > block.baseIndent)
            out.content.append(indent - block.baseIndent, ' ');
        out.content += text;
    }

    blocks_.push_back(std::move(out));
    open_.reset();
}

std::vector<CodeBlock> BlockAssembler::finish()
{
    close();
    return std::move(blocks_);
}

std::vector<CodeBlock> assembleBlocks(const std::vector<SourceLine> &lines)
{
    BlockAssembler assembler;
    for (const auto &line : lines)
        assembler.feed(line);
    return assembler.finish();
}

} // namespace fusion::frontends::lf
