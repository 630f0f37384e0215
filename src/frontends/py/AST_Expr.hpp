//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Expr.hpp
/// @brief Expression nodes of the native-language AST.
///
/// Every node records its kind for cheap downcasting and the source location
/// of its first token. Children are owned through unique_ptr.
///
/// @invariant Every Expr has a `kind` matching its concrete type.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/py/AST_Fwd.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace fusion::frontends::py
{

enum class ExprKind
{
    Name,
    IntLiteral,
    FloatLiteral,
    StringLiteral,
    FString,
    BoolLiteral,
    NoneLiteral,
    List,
    Tuple,
    Dict,
    Binary,
    Unary,
    BoolOp,
    Compare,
    Call,
    Attribute,
    Subscript,
    Slice,
    Conditional,
    ListComp,
    Lambda,
};

struct Expr
{
    ExprKind kind;
    SourceLoc loc;

    Expr(ExprKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Expr() = default;
};

struct NameExpr : Expr
{
    std::string name;

    NameExpr(SourceLoc l, std::string n) : Expr(ExprKind::Name, l), name(std::move(n)) {}
};

struct IntLiteralExpr : Expr
{
    int64_t value;

    IntLiteralExpr(SourceLoc l, int64_t v) : Expr(ExprKind::IntLiteral, l), value(v) {}
};

struct FloatLiteralExpr : Expr
{
    double value;

    FloatLiteralExpr(SourceLoc l, double v) : Expr(ExprKind::FloatLiteral, l), value(v) {}
};

struct StringLiteralExpr : Expr
{
    std::string value;

    StringLiteralExpr(SourceLoc l, std::string v)
        : Expr(ExprKind::StringLiteral, l), value(std::move(v))
    {
    }
};

/// @brief One piece of an f-string: literal text or a formatted expression.
struct FStringPart
{
    std::string literal; ///< Used when expr is null.
    ExprPtr expr;
    char conversion = 0; ///< 'r', 's' or 0.
    std::string spec;    ///< Format spec after ':'.
};

/// @brief `f"text {expr:spec} more"`.
struct FStringExpr : Expr
{
    std::vector<FStringPart> parts;

    explicit FStringExpr(SourceLoc l) : Expr(ExprKind::FString, l) {}
};

struct BoolLiteralExpr : Expr
{
    bool value;

    BoolLiteralExpr(SourceLoc l, bool v) : Expr(ExprKind::BoolLiteral, l), value(v) {}
};

struct NoneLiteralExpr : Expr
{
    explicit NoneLiteralExpr(SourceLoc l) : Expr(ExprKind::NoneLiteral, l) {}
};

struct ListExpr : Expr
{
    ExprList elements;

    ListExpr(SourceLoc l, ExprList e) : Expr(ExprKind::List, l), elements(std::move(e)) {}
};

struct TupleExpr : Expr
{
    ExprList elements;

    TupleExpr(SourceLoc l, ExprList e) : Expr(ExprKind::Tuple, l), elements(std::move(e)) {}
};

struct DictExpr : Expr
{
    std::vector<std::pair<ExprPtr, ExprPtr>> entries;

    explicit DictExpr(SourceLoc l) : Expr(ExprKind::Dict, l) {}
};

enum class BinaryOp
{
    Add,
    Sub,
    Mul,
    Div,
    FloorDiv,
    Mod,
    Pow,
};

struct BinaryExpr : Expr
{
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;

    BinaryExpr(SourceLoc l, BinaryOp o, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::Binary, l), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

enum class UnaryOp
{
    Neg,
    Pos,
    Not,
};

struct UnaryExpr : Expr
{
    UnaryOp op;
    ExprPtr operand;

    UnaryExpr(SourceLoc l, UnaryOp o, ExprPtr e)
        : Expr(ExprKind::Unary, l), op(o), operand(std::move(e))
    {
    }
};

/// @brief Short-circuit `and` / `or` over two operands.
struct BoolOpExpr : Expr
{
    bool isAnd;
    ExprPtr left;
    ExprPtr right;

    BoolOpExpr(SourceLoc l, bool a, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::BoolOp, l), isAnd(a), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

enum class CompareOp
{
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    In,
    NotIn,
    Is,
    IsNot,
};

/// @brief Chained comparison `a < b <= c`.
struct CompareExpr : Expr
{
    ExprPtr first;
    std::vector<std::pair<CompareOp, ExprPtr>> rest;

    CompareExpr(SourceLoc l, ExprPtr f) : Expr(ExprKind::Compare, l), first(std::move(f)) {}
};

struct KeywordArg
{
    std::string name;
    ExprPtr value;
};

struct CallExpr : Expr
{
    ExprPtr callee;
    ExprList args;
    std::vector<KeywordArg> kwargs;

    CallExpr(SourceLoc l, ExprPtr c) : Expr(ExprKind::Call, l), callee(std::move(c)) {}
};

struct AttributeExpr : Expr
{
    ExprPtr object;
    std::string attr;

    AttributeExpr(SourceLoc l, ExprPtr o, std::string a)
        : Expr(ExprKind::Attribute, l), object(std::move(o)), attr(std::move(a))
    {
    }
};

struct SubscriptExpr : Expr
{
    ExprPtr object;
    ExprPtr index; ///< May be a SliceExpr.

    SubscriptExpr(SourceLoc l, ExprPtr o, ExprPtr i)
        : Expr(ExprKind::Subscript, l), object(std::move(o)), index(std::move(i))
    {
    }
};

/// @brief `lo:hi:step` inside a subscript; any part may be null.
struct SliceExpr : Expr
{
    ExprPtr lower;
    ExprPtr upper;
    ExprPtr step;

    explicit SliceExpr(SourceLoc l) : Expr(ExprKind::Slice, l) {}
};

/// @brief `a if cond else b`.
struct ConditionalExpr : Expr
{
    ExprPtr condition;
    ExprPtr thenExpr;
    ExprPtr elseExpr;

    ConditionalExpr(SourceLoc l, ExprPtr c, ExprPtr t, ExprPtr e)
        : Expr(ExprKind::Conditional, l), condition(std::move(c)), thenExpr(std::move(t)),
          elseExpr(std::move(e))
    {
    }
};

/// @brief `[elt for target in iter if cond]` with a single generator.
struct ListCompExpr : Expr
{
    ExprPtr element;
    ExprPtr target;
    ExprPtr iterable;
    ExprList conditions;

    explicit ListCompExpr(SourceLoc l) : Expr(ExprKind::ListComp, l) {}
};

/// @brief `lambda a, b: expr`.
struct LambdaExpr : Expr
{
    std::vector<std::string> params;
    ExprPtr body;

    explicit LambdaExpr(SourceLoc l) : Expr(ExprKind::Lambda, l) {}
};

} // namespace fusion::frontends::py
