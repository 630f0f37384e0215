//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/py/Parser.cpp
// Purpose: Token-stream helpers and entry points of the native parser.
// Key invariants: Lookahead tokens are buffered in order; advance() never
//                 moves past Eof.
// Ownership/Lifetime: The parser borrows the lexer and diagnostic engine.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "frontends/py/Parser.hpp"

namespace fusion::frontends::py
{

Parser::Parser(Lexer &lexer, support::DiagnosticEngine &diag) : lexer_(lexer), diag_(diag) {}

const Token &Parser::peek(size_t offset)
{
    while (lookahead_.size() <= offset)
    {
        if (!lookahead_.empty() && lookahead_.back().kind == TokenKind::Eof)
            return lookahead_.back();
        lookahead_.push_back(lexer_.next());
    }
    return lookahead_[offset];
}

Token Parser::advance()
{
    Token t = peek();
    if (t.kind != TokenKind::Eof)
        lookahead_.pop_front();
    if (t.kind == TokenKind::Error)
    {
        hasError_ = true;
        throw Abort{};
    }
    return t;
}

bool Parser::check(TokenKind kind, size_t offset)
{
    return peek(offset).kind == kind;
}

bool Parser::match(TokenKind kind)
{
    if (!check(kind))
        return false;
    advance();
    return true;
}

Token Parser::expect(TokenKind kind, std::string_view what)
{
    if (!check(kind))
    {
        const Token &t = peek();
        std::string got = t.text.empty() ? std::string(tokenKindName(t.kind)) : "'" + t.text + "'";
        error(t.loc, "expected " + std::string(what) + ", got " + got);
    }
    return advance();
}

void Parser::error(const SourceLoc &loc, const std::string &message)
{
    // The lexer already reported its own errors.
    if (!hasError_ && peek().kind != TokenKind::Error)
        diag_.report(support::Diagnostic{support::Severity::Error, message, loc, "SyntaxError", std::nullopt});
    hasError_ = true;
    throw Abort{};
}

std::unique_ptr<Module> Parser::parseModule()
{
    auto module = std::make_unique<Module>();
    try
    {
        while (!check(TokenKind::Eof))
        {
            if (match(TokenKind::Newline))
                continue;
            if (check(TokenKind::Indent))
                error(peek().loc, "unexpected indent");
            parseStatementInto(module->body);
        }
    }
    catch (const Abort &)
    {
        return nullptr;
    }
    return module;
}

ExprPtr Parser::parseExpressionOnly()
{
    try
    {
        while (match(TokenKind::Newline) || match(TokenKind::Indent))
        {
        }
        ExprPtr e = parseTestList();
        while (match(TokenKind::Newline) || match(TokenKind::Dedent))
        {
        }
        if (!check(TokenKind::Eof))
            error(peek().loc, "unexpected trailing input in expression");
        return e;
    }
    catch (const Abort &)
    {
        return nullptr;
    }
}

std::shared_ptr<const Module> parseNativeSource(std::string_view source,
                                                uint32_t fileId,
                                                uint32_t firstLine,
                                                support::DiagnosticEngine &diag)
{
    Lexer lexer(std::string(source), fileId, diag, firstLine > 0 ? firstLine - 1 : 0);
    Parser parser(lexer, diag);
    auto module = parser.parseModule();
    if (!module || parser.hasError())
        return nullptr;
    return std::shared_ptr<const Module>(std::move(module));
}

ExprPtr parseNativeExpression(std::string_view source,
                              uint32_t fileId,
                              uint32_t line,
                              support::DiagnosticEngine &diag)
{
    Lexer lexer(std::string(source), fileId, diag, line > 0 ? line - 1 : 0);
    Parser parser(lexer, diag);
    auto expr = parser.parseExpressionOnly();
    if (parser.hasError())
        return nullptr;
    return expr;
}

} // namespace fusion::frontends::py
