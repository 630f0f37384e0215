//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/py/AST.cpp
// Purpose: Generic pre-order traversal of the native-language AST.
// Key invariants: Children are visited in source order.
// Ownership/Lifetime: The visitor never owns nodes.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#include "frontends/py/AST.hpp"

namespace fusion::frontends::py
{

void AstVisitor::walk(const Module &module)
{
    walkAll(module.body);
}

void AstVisitor::walkAll(const StmtList &list)
{
    for (const auto &s : list)
        walk(*s);
}

void AstVisitor::walk(const Stmt &stmt)
{
    visitStmt(stmt);
    switch (stmt.kind)
    {
        case StmtKind::Expr:
            walk(*static_cast<const ExprStmt &>(stmt).expr);
            break;
        case StmtKind::Assign:
        {
            const auto &s = static_cast<const AssignStmt &>(stmt);
            for (const auto &t : s.targets)
                walk(*t);
            walk(*s.value);
            break;
        }
        case StmtKind::AugAssign:
        {
            const auto &s = static_cast<const AugAssignStmt &>(stmt);
            walk(*s.target);
            walk(*s.value);
            break;
        }
        case StmtKind::If:
        {
            const auto &s = static_cast<const IfStmt &>(stmt);
            walk(*s.condition);
            walkAll(s.body);
            walkAll(s.orelse);
            break;
        }
        case StmtKind::While:
        {
            const auto &s = static_cast<const WhileStmt &>(stmt);
            walk(*s.condition);
            walkAll(s.body);
            walkAll(s.orelse);
            break;
        }
        case StmtKind::For:
        {
            const auto &s = static_cast<const ForStmt &>(stmt);
            walk(*s.target);
            walk(*s.iterable);
            walkAll(s.body);
            walkAll(s.orelse);
            break;
        }
        case StmtKind::Return:
        {
            const auto &s = static_cast<const ReturnStmt &>(stmt);
            if (s.value)
                walk(*s.value);
            break;
        }
        case StmtKind::FunctionDef:
        {
            const auto &s = static_cast<const FunctionDefStmt &>(stmt);
            for (const auto &p : s.params)
            {
                if (p.defaultValue)
                    walk(*p.defaultValue);
            }
            walkAll(s.body);
            break;
        }
        case StmtKind::Try:
        {
            const auto &s = static_cast<const TryStmt &>(stmt);
            walkAll(s.body);
            for (const auto &h : s.handlers)
            {
                if (h.type)
                    walk(*h.type);
                walkAll(h.body);
            }
            walkAll(s.orelse);
            walkAll(s.finalbody);
            break;
        }
        case StmtKind::Raise:
        {
            const auto &s = static_cast<const RaiseStmt &>(stmt);
            if (s.exception)
                walk(*s.exception);
            break;
        }
        case StmtKind::Del:
            for (const auto &t : static_cast<const DelStmt &>(stmt).targets)
                walk(*t);
            break;
        case StmtKind::Break:
        case StmtKind::Continue:
        case StmtKind::Pass:
        case StmtKind::Global:
        case StmtKind::Import:
        case StmtKind::ImportFrom:
            break;
    }
}

void AstVisitor::walk(const Expr &expr)
{
    visitExpr(expr);
    switch (expr.kind)
    {
        case ExprKind::FString:
            for (const auto &part : static_cast<const FStringExpr &>(expr).parts)
            {
                if (part.expr)
                    walk(*part.expr);
            }
            break;
        case ExprKind::List:
            for (const auto &e : static_cast<const ListExpr &>(expr).elements)
                walk(*e);
            break;
        case ExprKind::Tuple:
            for (const auto &e : static_cast<const TupleExpr &>(expr).elements)
                walk(*e);
            break;
        case ExprKind::Dict:
            for (const auto &[k, v] : static_cast<const DictExpr &>(expr).entries)
            {
                walk(*k);
                walk(*v);
            }
            break;
        case ExprKind::Binary:
        {
            const auto &e = static_cast<const BinaryExpr &>(expr);
            walk(*e.left);
            walk(*e.right);
            break;
        }
        case ExprKind::Unary:
            walk(*static_cast<const UnaryExpr &>(expr).operand);
            break;
        case ExprKind::BoolOp:
        {
            const auto &e = static_cast<const BoolOpExpr &>(expr);
            walk(*e.left);
            walk(*e.right);
            break;
        }
        case ExprKind::Compare:
        {
            const auto &e = static_cast<const CompareExpr &>(expr);
            walk(*e.first);
            for (const auto &[op, rhs] : e.rest)
                walk(*rhs);
            break;
        }
        case ExprKind::Call:
        {
            const auto &e = static_cast<const CallExpr &>(expr);
            walk(*e.callee);
            for (const auto &a : e.args)
                walk(*a);
            for (const auto &kw : e.kwargs)
                walk(*kw.value);
            break;
        }
        case ExprKind::Attribute:
            walk(*static_cast<const AttributeExpr &>(expr).object);
            break;
        case ExprKind::Subscript:
        {
            const auto &e = static_cast<const SubscriptExpr &>(expr);
            walk(*e.object);
            walk(*e.index);
            break;
        }
        case ExprKind::Slice:
        {
            const auto &e = static_cast<const SliceExpr &>(expr);
            if (e.lower)
                walk(*e.lower);
            if (e.upper)
                walk(*e.upper);
            if (e.step)
                walk(*e.step);
            break;
        }
        case ExprKind::Conditional:
        {
            const auto &e = static_cast<const ConditionalExpr &>(expr);
            walk(*e.condition);
            walk(*e.thenExpr);
            walk(*e.elseExpr);
            break;
        }
        case ExprKind::ListComp:
        {
            const auto &e = static_cast<const ListCompExpr &>(expr);
            walk(*e.iterable);
            walk(*e.target);
            for (const auto &c : e.conditions)
                walk(*c);
            walk(*e.element);
            break;
        }
        case ExprKind::Lambda:
            walk(*static_cast<const LambdaExpr &>(expr).body);
            break;
        case ExprKind::Name:
        case ExprKind::IntLiteral:
        case ExprKind::FloatLiteral:
        case ExprKind::StringLiteral:
        case ExprKind::BoolLiteral:
        case ExprKind::NoneLiteral:
            break;
    }
}

} // namespace fusion::frontends::py
