//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/py/Lexer.cpp
// Purpose: Native-language lexer with indentation tracking.
// Key invariants:
//   - Indentation is measured in columns with tabs advancing four columns.
//   - A dedent must land on a previously pushed indentation level.
//   - At end of input a Newline is emitted if needed, then one Dedent per
//     open indentation level, then Eof.
// Ownership/Lifetime: The lexer owns a copy of the source text.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "frontends/py/Lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace fusion::frontends::py
{
namespace
{
struct KeywordEntry
{
    std::string_view key;
    TokenKind kind;
};

// Sorted by key for binary search.
constexpr std::array<KeywordEntry, 28> kKeywordTable = {{
    {"False", TokenKind::KwFalse},     {"None", TokenKind::KwNone},
    {"True", TokenKind::KwTrue},       {"and", TokenKind::KwAnd},
    {"as", TokenKind::KwAs},           {"break", TokenKind::KwBreak},
    {"continue", TokenKind::KwContinue}, {"def", TokenKind::KwDef},
    {"del", TokenKind::KwDel},         {"elif", TokenKind::KwElif},
    {"else", TokenKind::KwElse},       {"except", TokenKind::KwExcept},
    {"finally", TokenKind::KwFinally}, {"for", TokenKind::KwFor},
    {"from", TokenKind::KwFrom},       {"global", TokenKind::KwGlobal},
    {"if", TokenKind::KwIf},           {"import", TokenKind::KwImport},
    {"in", TokenKind::KwIn},           {"is", TokenKind::KwIs},
    {"lambda", TokenKind::KwLambda},   {"not", TokenKind::KwNot},
    {"or", TokenKind::KwOr},           {"pass", TokenKind::KwPass},
    {"raise", TokenKind::KwRaise},     {"return", TokenKind::KwReturn},
    {"try", TokenKind::KwTry},         {"while", TokenKind::KwWhile},
}};

inline bool isIdentStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

inline bool isIdentContinue(char c)
{
    return isIdentStart(c) || std::isdigit(static_cast<unsigned char>(c));
}

int hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

void appendUtf8(std::string &out, uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}
} // namespace

std::string_view tokenKindName(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "end of input";
        case TokenKind::Error:
            return "invalid token";
        case TokenKind::Newline:
            return "newline";
        case TokenKind::Indent:
            return "indent";
        case TokenKind::Dedent:
            return "dedent";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::IntLiteral:
        case TokenKind::FloatLiteral:
            return "number";
        case TokenKind::StringLiteral:
        case TokenKind::FStringLiteral:
            return "string";
        case TokenKind::LParen:
            return "'('";
        case TokenKind::RParen:
            return "')'";
        case TokenKind::LBracket:
            return "'['";
        case TokenKind::RBracket:
            return "']'";
        case TokenKind::LBrace:
            return "'{'";
        case TokenKind::RBrace:
            return "'}'";
        case TokenKind::Colon:
            return "':'";
        case TokenKind::Comma:
            return "','";
        case TokenKind::Equal:
            return "'='";
        default:
            break;
    }
    for (const auto &entry : kKeywordTable)
    {
        if (entry.kind == kind)
            return entry.key;
    }
    return "operator";
}

std::optional<TokenKind> Lexer::lookupKeyword(const std::string &name)
{
    auto it = std::lower_bound(kKeywordTable.begin(),
                               kKeywordTable.end(),
                               name,
                               [](const KeywordEntry &entry, const std::string &key)
                               { return entry.key < key; });
    if (it != kKeywordTable.end() && it->key == name)
        return it->kind;
    return std::nullopt;
}

Lexer::Lexer(std::string source, uint32_t fileId, support::DiagnosticEngine &diag, uint32_t lineOffset)
    : source_(std::move(source)), fileId_(fileId), diag_(diag), line_(1 + lineOffset)
{
}

char Lexer::peekChar(size_t offset) const
{
    if (pos_ + offset >= source_.size())
        return '\0';
    return source_[pos_ + offset];
}

char Lexer::getChar()
{
    if (pos_ >= source_.size())
        return '\0';
    const char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

support::SourceLoc Lexer::currentLoc() const
{
    return support::SourceLoc{fileId_, line_, column_};
}

void Lexer::reportError(support::SourceLoc loc, const std::string &message)
{
    diag_.report(support::Diagnostic{support::Severity::Error, message, loc, "SyntaxError", std::nullopt});
}

Token Lexer::make(TokenKind kind, support::SourceLoc loc, std::string text)
{
    Token t;
    t.kind = kind;
    t.loc = loc;
    t.text = std::move(text);
    return t;
}

/// Consume indentation at the start of a logical line and queue Indent or
/// Dedent tokens. Returns false when the line is blank or comment-only and
/// has been skipped.
bool Lexer::handleLineStart()
{
    unsigned width = 0;
    while (peekChar() == ' ' || peekChar() == '\t')
        width += getChar() == '\t' ? 4 : 1;

    const char c = peekChar();
    if (c == '\n' || c == '\r')
    {
        getChar();
        return false;
    }
    if (c == '#')
    {
        while (!eof() && peekChar() != '\n')
            getChar();
        if (!eof())
            getChar();
        return false;
    }
    if (c == '\0')
        return true;

    atLineStart_ = false;
    const auto loc = currentLoc();
    if (width > indents_.back())
    {
        indents_.push_back(width);
        pending_.push_back(make(TokenKind::Indent, loc));
        return true;
    }
    while (width < indents_.back())
    {
        indents_.pop_back();
        pending_.push_back(make(TokenKind::Dedent, loc));
    }
    if (width != indents_.back())
    {
        reportError(loc, "unindent does not match any outer indentation level");
        pending_.push_back(make(TokenKind::Error, loc));
    }
    return true;
}

Token Lexer::next()
{
    while (true)
    {
        if (!pending_.empty())
        {
            Token t = std::move(pending_.front());
            pending_.pop_front();
            lastWasNewline_ = t.kind == TokenKind::Newline;
            return t;
        }

        if (atLineStart_ && parenDepth_ == 0)
        {
            if (eof())
                atLineStart_ = false;
            else if (!handleLineStart())
                continue;
            if (!pending_.empty())
                continue;
        }

        const char c = peekChar();
        if (c == '\0')
        {
            const auto loc = currentLoc();
            if (emittedAny_ && !lastWasNewline_)
                pending_.push_back(make(TokenKind::Newline, loc));
            while (indents_.size() > 1)
            {
                indents_.pop_back();
                pending_.push_back(make(TokenKind::Dedent, loc));
            }
            pending_.push_back(make(TokenKind::Eof, loc));
            emittedAny_ = false;
            Token t = std::move(pending_.front());
            pending_.pop_front();
            lastWasNewline_ = t.kind == TokenKind::Newline;
            return t;
        }

        if (c == ' ' || c == '\t' || c == '\r')
        {
            getChar();
            continue;
        }
        if (c == '#')
        {
            while (!eof() && peekChar() != '\n')
                getChar();
            continue;
        }
        if (c == '\\' && (peekChar(1) == '\n' || (peekChar(1) == '\r' && peekChar(2) == '\n')))
        {
            getChar();
            if (peekChar() == '\r')
                getChar();
            getChar();
            continue;
        }
        if (c == '\n')
        {
            const auto loc = currentLoc();
            getChar();
            if (parenDepth_ > 0)
                continue;
            atLineStart_ = true;
            if (lastWasNewline_)
                continue;
            lastWasNewline_ = true;
            return make(TokenKind::Newline, loc);
        }

        emittedAny_ = true;
        lastWasNewline_ = false;
        if (isIdentStart(c))
            return lexIdentifierOrString();
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(peekChar(1)))))
            return lexNumber();
        if (c == '"' || c == '\'')
            return lexString(currentLoc(), {});
        return lexOperator();
    }
}

Token Lexer::lexIdentifierOrString()
{
    const auto loc = currentLoc();
    std::string text;
    while (isIdentContinue(peekChar()))
        text.push_back(getChar());

    if (peekChar() == '"' || peekChar() == '\'')
    {
        std::string lower;
        for (char ch : text)
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        if (lower == "f" || lower == "r" || lower == "rf" || lower == "fr" || lower == "b" ||
            lower == "u")
            return lexString(loc, lower);
    }

    if (auto kw = lookupKeyword(text))
        return make(*kw, loc, text);
    Token t = make(TokenKind::Identifier, loc, text);
    return t;
}

Token Lexer::lexNumber()
{
    const auto loc = currentLoc();
    std::string text;
    std::string digits;

    if (peekChar() == '0' && std::string_view("xXoObB").find(peekChar(1)) != std::string_view::npos &&
        peekChar(1) != '\0')
    {
        text.push_back(getChar());
        const char radixChar = static_cast<char>(std::tolower(static_cast<unsigned char>(getChar())));
        text.push_back(radixChar);
        const int radix = radixChar == 'x' ? 16 : radixChar == 'o' ? 8 : 2;
        while (std::isalnum(static_cast<unsigned char>(peekChar())) || peekChar() == '_')
        {
            const char d = getChar();
            text.push_back(d);
            if (d != '_')
                digits.push_back(d);
        }
        errno = 0;
        char *end = nullptr;
        const unsigned long long v = std::strtoull(digits.c_str(), &end, radix);
        if (digits.empty() || *end != '\0' || errno == ERANGE ||
            v > static_cast<unsigned long long>(std::numeric_limits<int64_t>::max()))
        {
            reportError(loc, "invalid integer literal '" + text + "'");
            return make(TokenKind::Error, loc, text);
        }
        Token t = make(TokenKind::IntLiteral, loc, text);
        t.intValue = static_cast<int64_t>(v);
        return t;
    }

    bool isFloat = false;
    auto takeDigits = [&]() {
        while (std::isdigit(static_cast<unsigned char>(peekChar())) || peekChar() == '_')
        {
            const char d = getChar();
            text.push_back(d);
            if (d != '_')
                digits.push_back(d);
        }
    };

    takeDigits();
    if (peekChar() == '.' && peekChar(1) != '.')
    {
        isFloat = true;
        text.push_back(getChar());
        digits.push_back('.');
        takeDigits();
    }
    if (peekChar() == 'e' || peekChar() == 'E')
    {
        const char sign = peekChar(1);
        if (std::isdigit(static_cast<unsigned char>(sign)) ||
            ((sign == '+' || sign == '-') && std::isdigit(static_cast<unsigned char>(peekChar(2)))))
        {
            isFloat = true;
            text.push_back(getChar());
            digits.push_back('e');
            if (sign == '+' || sign == '-')
            {
                text.push_back(getChar());
                digits.push_back(sign);
            }
            takeDigits();
        }
    }

    if (isFloat)
    {
        Token t = make(TokenKind::FloatLiteral, loc, text);
        t.floatValue = std::strtod(digits.c_str(), nullptr);
        return t;
    }

    errno = 0;
    const long long v = std::strtoll(digits.c_str(), nullptr, 10);
    if (errno == ERANGE)
    {
        reportError(loc, "integer literal '" + text + "' is too large");
        return make(TokenKind::Error, loc, text);
    }
    Token t = make(TokenKind::IntLiteral, loc, text);
    t.intValue = v;
    return t;
}

Token Lexer::lexString(support::SourceLoc loc, std::string prefix)
{
    const bool raw = prefix.find('r') != std::string::npos;
    const bool fstring = prefix.find('f') != std::string::npos;

    const char quote = getChar();
    bool triple = false;
    if (peekChar() == quote && peekChar(1) == quote)
    {
        getChar();
        getChar();
        triple = true;
    }

    std::string value;
    while (true)
    {
        if (eof())
        {
            reportError(loc, "unterminated string literal");
            return make(TokenKind::Error, loc);
        }
        const char c = peekChar();
        if (!triple && c == '\n')
        {
            reportError(loc, "unterminated string literal");
            return make(TokenKind::Error, loc);
        }
        if (c == quote)
        {
            if (!triple)
            {
                getChar();
                break;
            }
            if (peekChar(1) == quote && peekChar(2) == quote)
            {
                getChar();
                getChar();
                getChar();
                break;
            }
        }
        if (c == '\\' && !raw)
        {
            getChar();
            const char e = getChar();
            switch (e)
            {
                case 'n':
                    value.push_back('\n');
                    break;
                case 't':
                    value.push_back('\t');
                    break;
                case 'r':
                    value.push_back('\r');
                    break;
                case '0':
                    value.push_back('\0');
                    break;
                case '\\':
                case '\'':
                case '"':
                    value.push_back(e);
                    break;
                case '\n':
                    break;
                case 'x':
                case 'u':
                {
                    const int count = e == 'x' ? 2 : 4;
                    uint32_t cp = 0;
                    bool ok = true;
                    for (int i = 0; i < count; ++i)
                    {
                        const int h = hexValue(peekChar());
                        if (h < 0)
                        {
                            ok = false;
                            break;
                        }
                        getChar();
                        cp = cp * 16 + static_cast<uint32_t>(h);
                    }
                    if (!ok)
                    {
                        reportError(loc, "malformed \\x or \\u escape in string");
                        return make(TokenKind::Error, loc);
                    }
                    appendUtf8(value, cp);
                    break;
                }
                default:
                    value.push_back('\\');
                    value.push_back(e);
                    break;
            }
            continue;
        }
        value.push_back(getChar());
    }

    Token t = make(fstring ? TokenKind::FStringLiteral : TokenKind::StringLiteral, loc);
    t.stringValue = std::move(value);
    return t;
}

Token Lexer::lexOperator()
{
    const auto loc = currentLoc();
    const char c = getChar();
    const char n = peekChar();

    auto two = [&](TokenKind kind, const char *text) {
        getChar();
        return make(kind, loc, text);
    };

    switch (c)
    {
        case '+':
            return n == '=' ? two(TokenKind::PlusEqual, "+=") : make(TokenKind::Plus, loc, "+");
        case '-':
            return n == '=' ? two(TokenKind::MinusEqual, "-=") : make(TokenKind::Minus, loc, "-");
        case '*':
            if (n == '*')
                return two(TokenKind::DoubleStar, "**");
            return n == '=' ? two(TokenKind::StarEqual, "*=") : make(TokenKind::Star, loc, "*");
        case '/':
            if (n == '/')
            {
                getChar();
                if (peekChar() == '=')
                    return two(TokenKind::DoubleSlashEqual, "//=");
                return make(TokenKind::DoubleSlash, loc, "//");
            }
            return n == '=' ? two(TokenKind::SlashEqual, "/=") : make(TokenKind::Slash, loc, "/");
        case '%':
            return n == '=' ? two(TokenKind::PercentEqual, "%=") : make(TokenKind::Percent, loc, "%");
        case '=':
            return n == '=' ? two(TokenKind::EqualEqual, "==") : make(TokenKind::Equal, loc, "=");
        case '!':
            if (n == '=')
                return two(TokenKind::NotEqual, "!=");
            break;
        case '<':
            return n == '=' ? two(TokenKind::LessEqual, "<=") : make(TokenKind::Less, loc, "<");
        case '>':
            return n == '=' ? two(TokenKind::GreaterEqual, ">=") : make(TokenKind::Greater, loc, ">");
        case '(':
            ++parenDepth_;
            return make(TokenKind::LParen, loc, "(");
        case ')':
            parenDepth_ = std::max(0, parenDepth_ - 1);
            return make(TokenKind::RParen, loc, ")");
        case '[':
            ++parenDepth_;
            return make(TokenKind::LBracket, loc, "[");
        case ']':
            parenDepth_ = std::max(0, parenDepth_ - 1);
            return make(TokenKind::RBracket, loc, "]");
        case '{':
            ++parenDepth_;
            return make(TokenKind::LBrace, loc, "{");
        case '}':
            parenDepth_ = std::max(0, parenDepth_ - 1);
            return make(TokenKind::RBrace, loc, "}");
        case ',':
            return make(TokenKind::Comma, loc, ",");
        case ':':
            return make(TokenKind::Colon, loc, ":");
        case '.':
            return make(TokenKind::Dot, loc, ".");
        case ';':
            return make(TokenKind::Semicolon, loc, ";");
        default:
            break;
    }
    reportError(loc, std::string("unexpected character '") + c + "'");
    return make(TokenKind::Error, loc, std::string(1, c));
}

} // namespace fusion::frontends::py
