//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Tokenizer for the native language.
///
/// The lexer tracks an indentation stack and bracket depth. Inside brackets
/// newlines are insignificant; outside them every logical line ends with a
/// Newline token and changes of indentation produce Indent/Dedent tokens.
/// Blank and comment-only lines are skipped entirely.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/py/Token.hpp"
#include "support/diagnostics.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace fusion::frontends::py
{

class Lexer
{
  public:
    /// @param lineOffset Added to every reported line so diagnostics point at
    ///        the physical line of the enclosing fusion source.
    Lexer(std::string source, uint32_t fileId, support::DiagnosticEngine &diag, uint32_t lineOffset = 0);

    /// @brief Produce the next token.
    Token next();

    static std::optional<TokenKind> lookupKeyword(const std::string &name);

  private:
    char peekChar(size_t offset = 0) const;
    char getChar();
    bool eof() const;
    support::SourceLoc currentLoc() const;
    void reportError(support::SourceLoc loc, const std::string &message);

    Token make(TokenKind kind, support::SourceLoc loc, std::string text = {});
    bool handleLineStart();
    Token lexIdentifierOrString();
    Token lexNumber();
    Token lexString(support::SourceLoc loc, std::string prefix);
    Token lexOperator();

    std::string source_;
    uint32_t fileId_;
    support::DiagnosticEngine &diag_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;

    bool atLineStart_ = true;
    bool emittedAny_ = false;
    bool lastWasNewline_ = true;
    int parenDepth_ = 0;
    std::vector<unsigned> indents_{0};
    std::deque<Token> pending_;
};

} // namespace fusion::frontends::py
