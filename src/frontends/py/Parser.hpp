//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive-descent parser for the native language.
///
/// ## Operator Precedence (lowest first)
///
/// | Level | Operators                          |
/// |-------|------------------------------------|
/// |   1   | `lambda`                           |
/// |   2   | `x if c else y`                    |
/// |   3   | `or`                               |
/// |   4   | `and`                              |
/// |   5   | `not`                              |
/// |   6   | comparisons, `in`, `is` (chained)  |
/// |   7   | `+` `-`                            |
/// |   8   | `*` `/` `//` `%`                   |
/// |   9   | unary `+` `-`                      |
/// |  10   | `**` (right associative)           |
/// |  11   | call, subscript, attribute         |
///
/// ## Error Handling
///
/// The first syntax error is reported to the diagnostic engine with the
/// physical line of the enclosing fusion source and parsing stops.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/py/AST.hpp"
#include "frontends/py/Lexer.hpp"
#include "support/diagnostics.hpp"

#include <deque>
#include <memory>
#include <string>
#include <string_view>

namespace fusion::frontends::py
{

class Parser
{
  public:
    Parser(Lexer &lexer, support::DiagnosticEngine &diag);

    /// @brief Parse a whole block; returns null after a syntax error.
    std::unique_ptr<Module> parseModule();

    /// @brief Parse a single expression followed by end of input.
    ExprPtr parseExpressionOnly();

    bool hasError() const
    {
        return hasError_;
    }

  private:
    struct Abort
    {
    };

    // Token stream
    const Token &peek(size_t offset = 0);
    Token advance();
    bool check(TokenKind kind, size_t offset = 0);
    bool match(TokenKind kind);
    Token expect(TokenKind kind, std::string_view what);
    [[noreturn]] void error(const SourceLoc &loc, const std::string &message);

    // Statements (Parser_Stmt.cpp)
    void parseStatementInto(StmtList &out);
    StmtPtr parseCompound();
    void parseSimpleStatements(StmtList &out);
    StmtPtr parseSmallStatement();
    StmtPtr parseExpressionStatement();
    StmtList parseSuite();
    StmtPtr parseIf(bool isElif);
    StmtPtr parseWhile();
    StmtPtr parseFor();
    StmtPtr parseDef();
    StmtPtr parseTry();
    StmtPtr parseImport();
    StmtPtr parseFromImport();
    std::string parseDottedName();
    void checkAssignable(const Expr &target);

    // Expressions (Parser_Expr.cpp)
    ExprPtr parseTestList();
    ExprPtr parseTargetList();
    ExprPtr parseTest();
    ExprPtr parseLambda();
    ExprPtr parseOrTest();
    ExprPtr parseAndTest();
    ExprPtr parseNotTest();
    ExprPtr parseComparison();
    ExprPtr parseArith();
    ExprPtr parseTerm();
    ExprPtr parseFactor();
    ExprPtr parsePower();
    ExprPtr parsePostfix();
    ExprPtr parseAtom();
    ExprPtr parseParenthesized(SourceLoc loc);
    ExprPtr parseListDisplay(SourceLoc loc);
    ExprPtr parseDictDisplay(SourceLoc loc);
    ExprPtr parseSubscriptIndex();
    ExprPtr parseStringAtom();
    void parseCallArguments(CallExpr &call);
    void appendFString(FStringExpr &out, const Token &tok);

    Lexer &lexer_;
    support::DiagnosticEngine &diag_;
    std::deque<Token> lookahead_;
    bool hasError_ = false;
    int depth_ = 0;
};

/// @brief Parse @p source as a native block whose first line is @p firstLine.
std::shared_ptr<const Module> parseNativeSource(std::string_view source,
                                                uint32_t fileId,
                                                uint32_t firstLine,
                                                support::DiagnosticEngine &diag);

/// @brief Parse @p source as one native expression.
ExprPtr parseNativeExpression(std::string_view source,
                              uint32_t fileId,
                              uint32_t line,
                              support::DiagnosticEngine &diag);

} // namespace fusion::frontends::py
