//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and token structure for the native-language lexer.
///
/// The native language is the indentation-structured scripting language that
/// fusion programs run in-process. Its lexer produces explicit Newline,
/// Indent and Dedent tokens so the parser never inspects whitespace.
///
/// @invariant Literal tokens have their value field populated.
/// @invariant Indent/Dedent tokens always appear directly after a Newline.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace fusion::frontends::py
{

enum class TokenKind
{
    Eof,
    Error,
    Newline,
    Indent,
    Dedent,

    Identifier,
    IntLiteral,
    FloatLiteral,
    StringLiteral,
    FStringLiteral, ///< Body of an f-string; parsed further by the parser.

    // Keywords
    KwAnd,
    KwAs,
    KwBreak,
    KwContinue,
    KwDef,
    KwDel,
    KwElif,
    KwElse,
    KwExcept,
    KwFalse,
    KwFinally,
    KwFor,
    KwFrom,
    KwGlobal,
    KwIf,
    KwImport,
    KwIn,
    KwIs,
    KwLambda,
    KwNone,
    KwNot,
    KwOr,
    KwPass,
    KwRaise,
    KwReturn,
    KwTrue,
    KwTry,
    KwWhile,

    // Operators
    Plus,
    Minus,
    Star,
    DoubleStar,
    Slash,
    DoubleSlash,
    Percent,
    Equal,
    PlusEqual,
    MinusEqual,
    StarEqual,
    SlashEqual,
    DoubleSlashEqual,
    PercentEqual,
    EqualEqual,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
    Comma,
    Colon,
    Dot,
    Semicolon,
};

/// @brief Printable name of @p kind for diagnostics.
std::string_view tokenKindName(TokenKind kind);

struct Token
{
    TokenKind kind = TokenKind::Eof;
    support::SourceLoc loc{};
    std::string text;        ///< Source spelling.
    int64_t intValue = 0;    ///< Valid for IntLiteral.
    double floatValue = 0.0; ///< Valid for FloatLiteral.
    std::string stringValue; ///< Unescaped body for string tokens.

    bool is(TokenKind k) const
    {
        return kind == k;
    }
};

} // namespace fusion::frontends::py
