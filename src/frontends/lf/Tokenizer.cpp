//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/Tokenizer.cpp
// Purpose: Line classifier for fusion sources.
// Key invariants:
//   - A directive is `#<identifier> "<value>"` optionally followed by a
//     `//` comment; anything else starting with '#' is a SyntaxError.
//   - A code line is `<identifier>.<code>`; an identifier that is not a
//     known tag is an UnknownLanguageError.
// Ownership/Lifetime: See Tokenizer.hpp.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#include "frontends/lf/Tokenizer.hpp"

#include <cctype>

namespace fusion::frontends::lf
{
namespace
{
using support::Diag;
using support::SourceLoc;

bool isIdentStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string_view rtrim(std::string_view s)
{
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

/// @brief Consume leading blanks, returning their width in columns.
unsigned takeIndent(std::string_view &s)
{
    unsigned width = 0;
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    {
        width += s.front() == '\t' ? kTabWidth : 1;
        s.remove_prefix(1);
    }
    return width;
}

Diag syntaxError(uint32_t fileId, uint32_t line, std::string msg)
{
    return support::makeError("SyntaxError", SourceLoc::atLine(fileId, line), std::move(msg));
}

/// @brief Parse `name "value"` after the leading '#'.
support::Expected<void> parseDirective(std::string_view body, SourceLine &out, uint32_t fileId)
{
    const uint32_t line = out.line;
    if (body.empty() || !isIdentStart(body.front()))
        return syntaxError(fileId, line, "malformed directive: expected a name after '#'");

    size_t i = 0;
    while (i < body.size() && isIdentChar(body[i]))
        ++i;
    out.name = std::string(body.substr(0, i));
    body.remove_prefix(i);

    const size_t before = body.size();
    takeIndent(body);
    if (body.empty() || body.front() != '"' || body.size() == before)
    {
        return syntaxError(fileId, line,
                           "directive '" + out.name + "' requires a double-quoted value");
    }

    body.remove_prefix(1);
    std::string value;
    bool closed = false;
    while (!body.empty())
    {
        const char c = body.front();
        body.remove_prefix(1);
        if (c == '\\' && !body.empty() && (body.front() == '"' || body.front() == '\\'))
        {
            value.push_back(body.front());
            body.remove_prefix(1);
            continue;
        }
        if (c == '"')
        {
            closed = true;
            break;
        }
        value.push_back(c);
    }
    if (!closed)
        return syntaxError(fileId, line, "unterminated directive value for '" + out.name + "'");

    takeIndent(body);
    if (!body.empty() && body.substr(0, 2) != "//")
    {
        return syntaxError(fileId, line,
                           "unexpected text after directive value for '" + out.name + "'");
    }

    out.value = std::move(value);
    out.kind = LineKind::Directive;
    return {};
}
} // namespace

std::vector<std::string_view> splitLines(std::string_view text)
{
    std::vector<std::string_view> lines;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\n' || text[i] == '\r')
        {
            lines.push_back(text.substr(start, i - start));
            if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            start = i + 1;
        }
    }
    if (start < text.size())
        lines.push_back(text.substr(start));
    return lines;
}

support::Expected<std::vector<SourceLine>> tokenize(std::string_view source, uint32_t fileId)
{
    std::vector<SourceLine> out;
    const auto physical = splitLines(source);
    out.reserve(physical.size());

    bool inBlockComment = false;
    uint32_t commentStart = 0;

    for (size_t idx = 0; idx < physical.size(); ++idx)
    {
        SourceLine sl;
        sl.line = static_cast<uint32_t>(idx + 1);
        sl.raw = std::string(rtrim(physical[idx]));

        std::string_view rest = sl.raw;
        unsigned lead = takeIndent(rest);

        // Leading block-comment spans are dropped; text after the last `*/`
        // is classified on its own and indented from the comment's end.
        bool sawComment = false;
        size_t searchFrom = 0;
        if (!inBlockComment && rest.substr(0, 2) == "/*")
        {
            inBlockComment = true;
            commentStart = sl.line;
            searchFrom = 2;
        }
        while (inBlockComment)
        {
            sawComment = true;
            const size_t close = rest.find("*/", searchFrom);
            if (close == std::string_view::npos)
            {
                rest = {};
                break;
            }
            inBlockComment = false;
            rest.remove_prefix(close + 2);
            lead = takeIndent(rest);
            if (rest.substr(0, 2) == "/*")
            {
                inBlockComment = true;
                commentStart = sl.line;
                searchFrom = 2;
            }
        }

        if (rest.empty())
        {
            sl.kind = sawComment ? LineKind::Comment : LineKind::Blank;
        }
        else if (rest.substr(0, 2) == "//")
        {
            sl.kind = LineKind::Comment;
        }
        else if (rest.front() == '#')
        {
            if (auto ok = parseDirective(rest.substr(1), sl, fileId); !ok)
                return ok.error();
        }
        else
        {
            size_t i = 0;
            while (i < rest.size() && isIdentChar(rest[i]))
                ++i;
            if (i == 0 || !isIdentStart(rest.front()) || i >= rest.size() || rest[i] != '.')
            {
                return syntaxError(fileId, sl.line,
                                   "malformed block line: expected '<tag>.<code>'");
            }

            const std::string_view tagText = rest.substr(0, i);
            auto tag = parseLanguageTag(tagText);
            if (!tag)
            {
                return support::makeError("UnknownLanguageError",
                                          SourceLoc::atLine(fileId, sl.line),
                                          "unknown language tag '" + std::string(tagText) + "'");
            }

            std::string_view code = rest.substr(i + 1);
            const unsigned inner = takeIndent(code);
            sl.kind = LineKind::Code;
            sl.tag = *tag;
            sl.indent = lead + inner;
            sl.code = std::string(code);
        }
        out.push_back(std::move(sl));
    }

    if (inBlockComment)
        return syntaxError(fileId, commentStart, "unterminated '/*' comment");

    return out;
}

} // namespace fusion::frontends::lf
