//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/py/Parser_Expr.cpp
// Purpose: Expression productions of the native parser.
// Key invariants: Recursion depth is bounded; `**` binds tighter than unary
//                 minus on its left and is right associative.
// Ownership/Lifetime: Produced nodes are owned by the caller.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "frontends/py/Parser.hpp"

namespace fusion::frontends::py
{

namespace
{

constexpr int kMaxExprDepth = 200;

/// @brief Tracks recursion depth of the expression productions.
class DepthGuard
{
  public:
    explicit DepthGuard(int &depth) : depth_(depth)
    {
        ++depth_;
    }

    ~DepthGuard()
    {
        --depth_;
    }

    DepthGuard(const DepthGuard &) = delete;
    DepthGuard &operator=(const DepthGuard &) = delete;

  private:
    int &depth_;
};

bool startsExpression(TokenKind k)
{
    switch (k)
    {
        case TokenKind::Identifier:
        case TokenKind::IntLiteral:
        case TokenKind::FloatLiteral:
        case TokenKind::StringLiteral:
        case TokenKind::FStringLiteral:
        case TokenKind::KwTrue:
        case TokenKind::KwFalse:
        case TokenKind::KwNone:
        case TokenKind::KwNot:
        case TokenKind::KwLambda:
        case TokenKind::Minus:
        case TokenKind::Plus:
        case TokenKind::LParen:
        case TokenKind::LBracket:
        case TokenKind::LBrace:
            return true;
        default:
            return false;
    }
}

} // namespace

ExprPtr Parser::parseTestList()
{
    const SourceLoc loc = peek().loc;
    ExprPtr first = parseTest();
    if (!check(TokenKind::Comma))
        return first;
    ExprList elems;
    elems.push_back(std::move(first));
    while (match(TokenKind::Comma))
    {
        if (!startsExpression(peek().kind))
            break;
        elems.push_back(parseTest());
    }
    return std::make_unique<TupleExpr>(loc, std::move(elems));
}

/// Targets stop below comparisons so the `in` of a for clause is not
/// consumed as a membership test.
ExprPtr Parser::parseTargetList()
{
    const SourceLoc loc = peek().loc;
    ExprPtr first = parseArith();
    if (!check(TokenKind::Comma))
        return first;
    ExprList elems;
    elems.push_back(std::move(first));
    while (match(TokenKind::Comma))
    {
        if (check(TokenKind::KwIn))
            break;
        elems.push_back(parseArith());
    }
    return std::make_unique<TupleExpr>(loc, std::move(elems));
}

ExprPtr Parser::parseTest()
{
    DepthGuard guard(depth_);
    if (depth_ > kMaxExprDepth)
        error(peek().loc, "expression nested too deeply");

    if (check(TokenKind::KwLambda))
        return parseLambda();

    const SourceLoc loc = peek().loc;
    ExprPtr value = parseOrTest();
    if (!check(TokenKind::KwIf))
        return value;
    advance();
    ExprPtr cond = parseOrTest();
    expect(TokenKind::KwElse, "'else' in conditional expression");
    ExprPtr other = parseTest();
    return std::make_unique<ConditionalExpr>(loc, std::move(cond), std::move(value), std::move(other));
}

ExprPtr Parser::parseLambda()
{
    auto lambda = std::make_unique<LambdaExpr>(advance().loc);
    while (!check(TokenKind::Colon))
    {
        lambda->params.push_back(expect(TokenKind::Identifier, "a parameter name").text);
        if (!match(TokenKind::Comma))
            break;
    }
    expect(TokenKind::Colon, "':' after lambda parameters");
    lambda->body = parseTest();
    return lambda;
}

ExprPtr Parser::parseOrTest()
{
    ExprPtr left = parseAndTest();
    while (check(TokenKind::KwOr))
    {
        const SourceLoc loc = advance().loc;
        left = std::make_unique<BoolOpExpr>(loc, false, std::move(left), parseAndTest());
    }
    return left;
}

ExprPtr Parser::parseAndTest()
{
    ExprPtr left = parseNotTest();
    while (check(TokenKind::KwAnd))
    {
        const SourceLoc loc = advance().loc;
        left = std::make_unique<BoolOpExpr>(loc, true, std::move(left), parseNotTest());
    }
    return left;
}

ExprPtr Parser::parseNotTest()
{
    if (check(TokenKind::KwNot))
    {
        DepthGuard guard(depth_);
        if (depth_ > kMaxExprDepth)
            error(peek().loc, "expression nested too deeply");
        const SourceLoc loc = advance().loc;
        return std::make_unique<UnaryExpr>(loc, UnaryOp::Not, parseNotTest());
    }
    return parseComparison();
}

ExprPtr Parser::parseComparison()
{
    const SourceLoc loc = peek().loc;
    ExprPtr first = parseArith();
    std::unique_ptr<CompareExpr> cmp;
    while (true)
    {
        CompareOp op;
        switch (peek().kind)
        {
            case TokenKind::EqualEqual:
                op = CompareOp::Eq;
                break;
            case TokenKind::NotEqual:
                op = CompareOp::Ne;
                break;
            case TokenKind::Less:
                op = CompareOp::Lt;
                break;
            case TokenKind::LessEqual:
                op = CompareOp::Le;
                break;
            case TokenKind::Greater:
                op = CompareOp::Gt;
                break;
            case TokenKind::GreaterEqual:
                op = CompareOp::Ge;
                break;
            case TokenKind::KwIn:
                op = CompareOp::In;
                break;
            case TokenKind::KwIs:
                op = check(TokenKind::KwNot, 1) ? CompareOp::IsNot : CompareOp::Is;
                break;
            case TokenKind::KwNot:
                if (!check(TokenKind::KwIn, 1))
                    return cmp ? ExprPtr(std::move(cmp)) : std::move(first);
                op = CompareOp::NotIn;
                break;
            default:
                return cmp ? ExprPtr(std::move(cmp)) : std::move(first);
        }
        advance();
        if (op == CompareOp::IsNot || op == CompareOp::NotIn)
            advance();
        if (!cmp)
            cmp = std::make_unique<CompareExpr>(loc, std::move(first));
        cmp->rest.emplace_back(op, parseArith());
    }
}

ExprPtr Parser::parseArith()
{
    ExprPtr left = parseTerm();
    while (check(TokenKind::Plus) || check(TokenKind::Minus))
    {
        const Token op = advance();
        left = std::make_unique<BinaryExpr>(op.loc,
                                            op.kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub,
                                            std::move(left),
                                            parseTerm());
    }
    return left;
}

ExprPtr Parser::parseTerm()
{
    ExprPtr left = parseFactor();
    while (true)
    {
        BinaryOp op;
        switch (peek().kind)
        {
            case TokenKind::Star:
                op = BinaryOp::Mul;
                break;
            case TokenKind::Slash:
                op = BinaryOp::Div;
                break;
            case TokenKind::DoubleSlash:
                op = BinaryOp::FloorDiv;
                break;
            case TokenKind::Percent:
                op = BinaryOp::Mod;
                break;
            default:
                return left;
        }
        const SourceLoc loc = advance().loc;
        left = std::make_unique<BinaryExpr>(loc, op, std::move(left), parseFactor());
    }
}

ExprPtr Parser::parseFactor()
{
    if (check(TokenKind::Minus) || check(TokenKind::Plus))
    {
        DepthGuard guard(depth_);
        if (depth_ > kMaxExprDepth)
            error(peek().loc, "expression nested too deeply");
        const Token op = advance();
        return std::make_unique<UnaryExpr>(
            op.loc, op.kind == TokenKind::Minus ? UnaryOp::Neg : UnaryOp::Pos, parseFactor());
    }
    return parsePower();
}

ExprPtr Parser::parsePower()
{
    ExprPtr base = parsePostfix();
    if (!check(TokenKind::DoubleStar))
        return base;
    const SourceLoc loc = advance().loc;
    return std::make_unique<BinaryExpr>(loc, BinaryOp::Pow, std::move(base), parseFactor());
}

ExprPtr Parser::parsePostfix()
{
    ExprPtr e = parseAtom();
    while (true)
    {
        if (check(TokenKind::LParen))
        {
            auto call = std::make_unique<CallExpr>(advance().loc, std::move(e));
            parseCallArguments(*call);
            e = std::move(call);
        }
        else if (check(TokenKind::LBracket))
        {
            const SourceLoc loc = advance().loc;
            ExprPtr index = parseSubscriptIndex();
            expect(TokenKind::RBracket, "']'");
            e = std::make_unique<SubscriptExpr>(loc, std::move(e), std::move(index));
        }
        else if (check(TokenKind::Dot))
        {
            const SourceLoc loc = advance().loc;
            std::string attr = expect(TokenKind::Identifier, "an attribute name").text;
            e = std::make_unique<AttributeExpr>(loc, std::move(e), std::move(attr));
        }
        else
        {
            return e;
        }
    }
}

void Parser::parseCallArguments(CallExpr &call)
{
    while (!check(TokenKind::RParen))
    {
        if (check(TokenKind::Identifier) && check(TokenKind::Equal, 1))
        {
            KeywordArg kw;
            kw.name = advance().text;
            advance();
            kw.value = parseTest();
            for (const auto &existing : call.kwargs)
            {
                if (existing.name == kw.name)
                    error(call.loc, "keyword argument repeated: " + kw.name);
            }
            call.kwargs.push_back(std::move(kw));
        }
        else
        {
            if (!call.kwargs.empty())
                error(peek().loc, "positional argument follows keyword argument");
            call.args.push_back(parseTest());
        }
        if (!match(TokenKind::Comma))
            break;
    }
    expect(TokenKind::RParen, "')'");
}

ExprPtr Parser::parseSubscriptIndex()
{
    const SourceLoc loc = peek().loc;
    ExprPtr lower;
    if (!check(TokenKind::Colon))
    {
        lower = parseTestList();
        if (!check(TokenKind::Colon))
            return lower;
    }
    auto slice = std::make_unique<SliceExpr>(loc);
    slice->lower = std::move(lower);
    advance();
    if (!check(TokenKind::Colon) && !check(TokenKind::RBracket))
        slice->upper = parseTest();
    if (match(TokenKind::Colon))
    {
        if (!check(TokenKind::RBracket))
            slice->step = parseTest();
    }
    return slice;
}

ExprPtr Parser::parseAtom()
{
    const Token &t = peek();
    const SourceLoc loc = t.loc;
    switch (t.kind)
    {
        case TokenKind::Identifier:
            return std::make_unique<NameExpr>(loc, advance().text);
        case TokenKind::IntLiteral:
            return std::make_unique<IntLiteralExpr>(loc, advance().intValue);
        case TokenKind::FloatLiteral:
            return std::make_unique<FloatLiteralExpr>(loc, advance().floatValue);
        case TokenKind::StringLiteral:
        case TokenKind::FStringLiteral:
            return parseStringAtom();
        case TokenKind::KwTrue:
            advance();
            return std::make_unique<BoolLiteralExpr>(loc, true);
        case TokenKind::KwFalse:
            advance();
            return std::make_unique<BoolLiteralExpr>(loc, false);
        case TokenKind::KwNone:
            advance();
            return std::make_unique<NoneLiteralExpr>(loc);
        case TokenKind::LParen:
            advance();
            return parseParenthesized(loc);
        case TokenKind::LBracket:
            advance();
            return parseListDisplay(loc);
        case TokenKind::LBrace:
            advance();
            return parseDictDisplay(loc);
        default:
            break;
    }
    if (t.kind == TokenKind::Newline || t.kind == TokenKind::Eof)
        error(loc, "unexpected end of line");
    error(loc, "invalid syntax near " + (t.text.empty() ? std::string(tokenKindName(t.kind)) : "'" + t.text + "'"));
}

ExprPtr Parser::parseParenthesized(SourceLoc loc)
{
    DepthGuard guard(depth_);
    if (depth_ > kMaxExprDepth)
        error(loc, "expression nested too deeply");

    if (match(TokenKind::RParen))
        return std::make_unique<TupleExpr>(loc, ExprList{});
    ExprPtr first = parseTest();
    if (match(TokenKind::RParen))
        return first;
    ExprList elems;
    elems.push_back(std::move(first));
    while (match(TokenKind::Comma))
    {
        if (check(TokenKind::RParen))
            break;
        elems.push_back(parseTest());
    }
    expect(TokenKind::RParen, "')'");
    return std::make_unique<TupleExpr>(loc, std::move(elems));
}

ExprPtr Parser::parseListDisplay(SourceLoc loc)
{
    DepthGuard guard(depth_);
    if (depth_ > kMaxExprDepth)
        error(loc, "expression nested too deeply");

    ExprList elems;
    if (match(TokenKind::RBracket))
        return std::make_unique<ListExpr>(loc, std::move(elems));

    ExprPtr first = parseTest();
    if (match(TokenKind::KwFor))
    {
        auto comp = std::make_unique<ListCompExpr>(loc);
        comp->element = std::move(first);
        comp->target = parseTargetList();
        checkAssignable(*comp->target);
        expect(TokenKind::KwIn, "'in'");
        comp->iterable = parseOrTest();
        while (match(TokenKind::KwIf))
            comp->conditions.push_back(parseOrTest());
        if (check(TokenKind::KwFor))
            error(peek().loc, "nested comprehension generators are not supported");
        expect(TokenKind::RBracket, "']'");
        return comp;
    }

    elems.push_back(std::move(first));
    while (match(TokenKind::Comma))
    {
        if (check(TokenKind::RBracket))
            break;
        elems.push_back(parseTest());
    }
    expect(TokenKind::RBracket, "']'");
    return std::make_unique<ListExpr>(loc, std::move(elems));
}

ExprPtr Parser::parseDictDisplay(SourceLoc loc)
{
    DepthGuard guard(depth_);
    if (depth_ > kMaxExprDepth)
        error(loc, "expression nested too deeply");

    auto dict = std::make_unique<DictExpr>(loc);
    while (!check(TokenKind::RBrace))
    {
        ExprPtr key = parseTest();
        expect(TokenKind::Colon, "':' in dict display");
        ExprPtr value = parseTest();
        dict->entries.emplace_back(std::move(key), std::move(value));
        if (!match(TokenKind::Comma))
            break;
    }
    expect(TokenKind::RBrace, "'}'");
    return dict;
}

ExprPtr Parser::parseStringAtom()
{
    const SourceLoc loc = peek().loc;
    bool anyFormatted = false;
    std::vector<Token> pieces;
    while (check(TokenKind::StringLiteral) || check(TokenKind::FStringLiteral))
    {
        pieces.push_back(advance());
        anyFormatted = anyFormatted || pieces.back().kind == TokenKind::FStringLiteral;
    }

    if (!anyFormatted)
    {
        std::string joined;
        for (const auto &p : pieces)
            joined += p.stringValue;
        return std::make_unique<StringLiteralExpr>(loc, std::move(joined));
    }

    auto fstr = std::make_unique<FStringExpr>(loc);
    for (const auto &p : pieces)
    {
        if (p.kind == TokenKind::FStringLiteral)
        {
            appendFString(*fstr, p);
        }
        else if (!p.stringValue.empty())
        {
            FStringPart part;
            part.literal = p.stringValue;
            fstr->parts.push_back(std::move(part));
        }
    }
    return fstr;
}

void Parser::appendFString(FStringExpr &out, const Token &tok)
{
    const std::string &body = tok.stringValue;
    std::string literal;
    auto flushLiteral = [&]() {
        if (literal.empty())
            return;
        if (!out.parts.empty() && !out.parts.back().expr)
        {
            out.parts.back().literal += literal;
        }
        else
        {
            FStringPart part;
            part.literal = std::move(literal);
            out.parts.push_back(std::move(part));
        }
        literal.clear();
    };

    size_t i = 0;
    while (i < body.size())
    {
        const char c = body[i];
        if (c == '{' && i + 1 < body.size() && body[i + 1] == '{')
        {
            literal.push_back('{');
            i += 2;
            continue;
        }
        if (c == '}' && i + 1 < body.size() && body[i + 1] == '}')
        {
            literal.push_back('}');
            i += 2;
            continue;
        }
        if (c == '}')
            error(tok.loc, "f-string: single '}' is not allowed");
        if (c != '{')
        {
            literal.push_back(c);
            ++i;
            continue;
        }

        // Find the end of the replacement field, honoring nested brackets
        // and quoted strings inside the expression.
        size_t j = i + 1;
        int nest = 0;
        char quote = 0;
        size_t exprEnd = std::string::npos;
        size_t convPos = std::string::npos;
        size_t specPos = std::string::npos;
        for (; j < body.size(); ++j)
        {
            const char d = body[j];
            if (quote)
            {
                if (d == quote)
                    quote = 0;
                continue;
            }
            if (d == '\'' || d == '"')
            {
                quote = d;
                continue;
            }
            if (d == '(' || d == '[' || d == '{')
            {
                ++nest;
                continue;
            }
            if ((d == ')' || d == ']') && nest > 0)
            {
                --nest;
                continue;
            }
            if (d == '}' && nest > 0)
            {
                --nest;
                continue;
            }
            if (nest > 0)
                continue;
            if (d == '!' && j + 1 < body.size() && body[j + 1] != '=' && exprEnd == std::string::npos)
            {
                exprEnd = j;
                convPos = j + 1;
                continue;
            }
            if (d == ':' && specPos == std::string::npos)
            {
                if (exprEnd == std::string::npos)
                    exprEnd = j;
                specPos = j + 1;
                break;
            }
            if (d == '}')
                break;
        }
        if (specPos != std::string::npos)
        {
            j = body.find('}', specPos);
        }
        if (j == std::string::npos || j >= body.size())
            error(tok.loc, "f-string: expecting '}'");
        if (exprEnd == std::string::npos)
            exprEnd = j;

        FStringPart part;
        if (convPos != std::string::npos)
        {
            const size_t convEnd = specPos != std::string::npos ? specPos - 1 : j;
            const std::string conv = body.substr(convPos, convEnd - convPos);
            if (conv != "r" && conv != "s")
                error(tok.loc, "f-string: invalid conversion character '" + conv + "'");
            part.conversion = conv[0];
        }
        if (specPos != std::string::npos)
            part.spec = body.substr(specPos, j - specPos);

        const std::string exprText = body.substr(i + 1, exprEnd - (i + 1));
        if (exprText.find_first_not_of(" \t") == std::string::npos)
            error(tok.loc, "f-string: empty expression not allowed");
        part.expr = parseNativeExpression(exprText, tok.loc.file_id, tok.loc.line, diag_);
        if (!part.expr)
        {
            hasError_ = true;
            throw Abort{};
        }

        flushLiteral();
        out.parts.push_back(std::move(part));
        i = j + 1;
    }
    flushLiteral();
}

} // namespace fusion::frontends::py
