//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/py/Parser_Stmt.cpp
// Purpose: Statement productions of the native parser.
// Key invariants: A suite is either simple statements on the header line or
//                 NEWLINE INDENT statement+ DEDENT.
// Ownership/Lifetime: Produced nodes are owned by the caller.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "frontends/py/Parser.hpp"

namespace fusion::frontends::py
{

void Parser::parseStatementInto(StmtList &out)
{
    switch (peek().kind)
    {
        case TokenKind::KwIf:
        case TokenKind::KwWhile:
        case TokenKind::KwFor:
        case TokenKind::KwDef:
        case TokenKind::KwTry:
            out.push_back(parseCompound());
            return;
        default:
            parseSimpleStatements(out);
            return;
    }
}

StmtPtr Parser::parseCompound()
{
    switch (peek().kind)
    {
        case TokenKind::KwIf:
            return parseIf(false);
        case TokenKind::KwWhile:
            return parseWhile();
        case TokenKind::KwFor:
            return parseFor();
        case TokenKind::KwDef:
            return parseDef();
        case TokenKind::KwTry:
            return parseTry();
        default:
            error(peek().loc, "expected a compound statement");
    }
}

void Parser::parseSimpleStatements(StmtList &out)
{
    out.push_back(parseSmallStatement());
    while (match(TokenKind::Semicolon))
    {
        if (check(TokenKind::Newline) || check(TokenKind::Eof))
            break;
        out.push_back(parseSmallStatement());
    }
    if (!match(TokenKind::Newline) && !check(TokenKind::Eof) && !check(TokenKind::Dedent))
    {
        const Token &t = peek();
        error(t.loc, "unexpected " + (t.text.empty() ? std::string(tokenKindName(t.kind)) : "'" + t.text + "'"));
    }
}

StmtPtr Parser::parseSmallStatement()
{
    const Token &t = peek();
    const SourceLoc loc = t.loc;
    switch (t.kind)
    {
        case TokenKind::KwPass:
            advance();
            return std::make_unique<SimpleStmt>(StmtKind::Pass, loc);
        case TokenKind::KwBreak:
            advance();
            return std::make_unique<SimpleStmt>(StmtKind::Break, loc);
        case TokenKind::KwContinue:
            advance();
            return std::make_unique<SimpleStmt>(StmtKind::Continue, loc);
        case TokenKind::KwReturn:
        {
            advance();
            ExprPtr value;
            if (!check(TokenKind::Newline) && !check(TokenKind::Semicolon) && !check(TokenKind::Eof) &&
                !check(TokenKind::Dedent))
                value = parseTestList();
            return std::make_unique<ReturnStmt>(loc, std::move(value));
        }
        case TokenKind::KwRaise:
        {
            advance();
            ExprPtr value;
            if (!check(TokenKind::Newline) && !check(TokenKind::Semicolon) && !check(TokenKind::Eof) &&
                !check(TokenKind::Dedent))
                value = parseTest();
            return std::make_unique<RaiseStmt>(loc, std::move(value));
        }
        case TokenKind::KwGlobal:
        {
            advance();
            auto g = std::make_unique<GlobalStmt>(loc);
            do
            {
                g->names.push_back(expect(TokenKind::Identifier, "a name").text);
            } while (match(TokenKind::Comma));
            return g;
        }
        case TokenKind::KwDel:
        {
            advance();
            ExprList targets;
            do
            {
                targets.push_back(parsePostfix());
                checkAssignable(*targets.back());
            } while (match(TokenKind::Comma));
            return std::make_unique<DelStmt>(loc, std::move(targets));
        }
        case TokenKind::KwImport:
            return parseImport();
        case TokenKind::KwFrom:
            return parseFromImport();
        default:
            return parseExpressionStatement();
    }
}

void Parser::checkAssignable(const Expr &target)
{
    switch (target.kind)
    {
        case ExprKind::Name:
        case ExprKind::Attribute:
        case ExprKind::Subscript:
            return;
        case ExprKind::Tuple:
            for (const auto &e : static_cast<const TupleExpr &>(target).elements)
                checkAssignable(*e);
            return;
        case ExprKind::List:
            for (const auto &e : static_cast<const ListExpr &>(target).elements)
                checkAssignable(*e);
            return;
        default:
            error(target.loc, "cannot assign to expression");
    }
}

StmtPtr Parser::parseExpressionStatement()
{
    const SourceLoc loc = peek().loc;
    ExprPtr first = parseTestList();

    BinaryOp augOp{};
    bool isAug = true;
    switch (peek().kind)
    {
        case TokenKind::PlusEqual:
            augOp = BinaryOp::Add;
            break;
        case TokenKind::MinusEqual:
            augOp = BinaryOp::Sub;
            break;
        case TokenKind::StarEqual:
            augOp = BinaryOp::Mul;
            break;
        case TokenKind::SlashEqual:
            augOp = BinaryOp::Div;
            break;
        case TokenKind::DoubleSlashEqual:
            augOp = BinaryOp::FloorDiv;
            break;
        case TokenKind::PercentEqual:
            augOp = BinaryOp::Mod;
            break;
        default:
            isAug = false;
            break;
    }
    if (isAug)
    {
        advance();
        if (first->kind != ExprKind::Name && first->kind != ExprKind::Attribute &&
            first->kind != ExprKind::Subscript)
            error(first->loc, "illegal target for augmented assignment");
        ExprPtr value = parseTestList();
        return std::make_unique<AugAssignStmt>(loc, std::move(first), augOp, std::move(value));
    }

    if (!check(TokenKind::Equal))
        return std::make_unique<ExprStmt>(loc, std::move(first));

    ExprList targets;
    targets.push_back(std::move(first));
    ExprPtr value;
    while (match(TokenKind::Equal))
    {
        value = parseTestList();
        if (check(TokenKind::Equal))
            targets.push_back(std::move(value));
    }
    for (const auto &t : targets)
        checkAssignable(*t);
    return std::make_unique<AssignStmt>(loc, std::move(targets), std::move(value));
}

StmtList Parser::parseSuite()
{
    expect(TokenKind::Colon, "':'");
    StmtList body;
    if (!match(TokenKind::Newline))
    {
        parseSimpleStatements(body);
        return body;
    }
    while (match(TokenKind::Newline))
    {
    }
    expect(TokenKind::Indent, "an indented block");
    if (++depth_ > 100)
        error(peek().loc, "too many nested blocks");
    while (!check(TokenKind::Dedent) && !check(TokenKind::Eof))
    {
        if (match(TokenKind::Newline))
            continue;
        parseStatementInto(body);
    }
    match(TokenKind::Dedent);
    --depth_;
    return body;
}

StmtPtr Parser::parseIf(bool isElif)
{
    const SourceLoc loc = advance().loc;
    (void)isElif;
    auto stmt = std::make_unique<IfStmt>(loc, parseTest());
    stmt->body = parseSuite();
    if (check(TokenKind::KwElif))
    {
        stmt->orelse.push_back(parseIf(true));
    }
    else if (match(TokenKind::KwElse))
    {
        stmt->orelse = parseSuite();
    }
    return stmt;
}

StmtPtr Parser::parseWhile()
{
    const SourceLoc loc = advance().loc;
    auto stmt = std::make_unique<WhileStmt>(loc, parseTest());
    stmt->body = parseSuite();
    if (match(TokenKind::KwElse))
        stmt->orelse = parseSuite();
    return stmt;
}

StmtPtr Parser::parseFor()
{
    const SourceLoc loc = advance().loc;
    ExprPtr target = parseTargetList();
    checkAssignable(*target);
    expect(TokenKind::KwIn, "'in'");
    ExprPtr iterable = parseTestList();
    auto stmt = std::make_unique<ForStmt>(loc, std::move(target), std::move(iterable));
    stmt->body = parseSuite();
    if (match(TokenKind::KwElse))
        stmt->orelse = parseSuite();
    return stmt;
}

StmtPtr Parser::parseDef()
{
    const SourceLoc loc = advance().loc;
    auto def = std::make_unique<FunctionDefStmt>(loc, expect(TokenKind::Identifier, "a function name").text);
    expect(TokenKind::LParen, "'('");
    bool sawDefault = false;
    while (!check(TokenKind::RParen))
    {
        Param p;
        p.name = expect(TokenKind::Identifier, "a parameter name").text;
        if (match(TokenKind::Equal))
        {
            p.defaultValue = parseTest();
            sawDefault = true;
        }
        else if (sawDefault)
        {
            error(loc, "non-default parameter follows default parameter");
        }
        def->params.push_back(std::move(p));
        if (!match(TokenKind::Comma))
            break;
    }
    expect(TokenKind::RParen, "')'");
    def->body = parseSuite();
    return def;
}

StmtPtr Parser::parseTry()
{
    const SourceLoc loc = advance().loc;
    auto stmt = std::make_unique<TryStmt>(loc);
    stmt->body = parseSuite();

    while (check(TokenKind::KwExcept))
    {
        ExceptHandler h;
        h.loc = advance().loc;
        if (!check(TokenKind::Colon))
        {
            h.type = parseTest();
            if (match(TokenKind::KwAs))
                h.name = expect(TokenKind::Identifier, "a name").text;
        }
        h.body = parseSuite();
        stmt->handlers.push_back(std::move(h));
    }
    if (!stmt->handlers.empty() && match(TokenKind::KwElse))
        stmt->orelse = parseSuite();
    if (match(TokenKind::KwFinally))
        stmt->finalbody = parseSuite();
    if (stmt->handlers.empty() && stmt->finalbody.empty())
        error(loc, "expected 'except' or 'finally' block");
    return stmt;
}

std::string Parser::parseDottedName()
{
    std::string name = expect(TokenKind::Identifier, "a module name").text;
    while (match(TokenKind::Dot))
        name += "." + expect(TokenKind::Identifier, "a module name").text;
    return name;
}

StmtPtr Parser::parseImport()
{
    const SourceLoc loc = advance().loc;
    auto stmt = std::make_unique<ImportStmt>(loc);
    do
    {
        ImportAlias alias;
        alias.module = parseDottedName();
        if (match(TokenKind::KwAs))
            alias.asName = expect(TokenKind::Identifier, "a name").text;
        stmt->names.push_back(std::move(alias));
    } while (match(TokenKind::Comma));
    return stmt;
}

StmtPtr Parser::parseFromImport()
{
    const SourceLoc loc = advance().loc;
    auto stmt = std::make_unique<ImportFromStmt>(loc, parseDottedName());
    expect(TokenKind::KwImport, "'import'");
    if (match(TokenKind::Star))
    {
        stmt->names.push_back(ImportAlias{"*", {}});
        return stmt;
    }
    const bool paren = match(TokenKind::LParen);
    do
    {
        if (paren && check(TokenKind::RParen))
            break;
        ImportAlias alias;
        alias.module = expect(TokenKind::Identifier, "a name").text;
        if (match(TokenKind::KwAs))
            alias.asName = expect(TokenKind::Identifier, "a name").text;
        stmt->names.push_back(std::move(alias));
    } while (match(TokenKind::Comma));
    if (paren)
        expect(TokenKind::RParen, "')'");
    return stmt;
}

} // namespace fusion::frontends::py
