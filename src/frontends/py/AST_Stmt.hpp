//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Stmt.hpp
/// @brief Statement nodes of the native-language AST.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/py/AST_Expr.hpp"

#include <string>
#include <utility>

namespace fusion::frontends::py
{

enum class StmtKind
{
    Expr,
    Assign,
    AugAssign,
    If,
    While,
    For,
    Break,
    Continue,
    Pass,
    Return,
    FunctionDef,
    Global,
    Import,
    ImportFrom,
    Try,
    Raise,
    Del,
};

struct Stmt
{
    StmtKind kind;
    SourceLoc loc;

    Stmt(StmtKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Stmt() = default;
};

struct ExprStmt : Stmt
{
    ExprPtr expr;

    ExprStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Expr, l), expr(std::move(e)) {}
};

/// @brief `a = b = value`; each target may be a name, tuple, attribute or subscript.
struct AssignStmt : Stmt
{
    ExprList targets;
    ExprPtr value;

    AssignStmt(SourceLoc l, ExprList t, ExprPtr v)
        : Stmt(StmtKind::Assign, l), targets(std::move(t)), value(std::move(v))
    {
    }
};

struct AugAssignStmt : Stmt
{
    ExprPtr target;
    BinaryOp op;
    ExprPtr value;

    AugAssignStmt(SourceLoc l, ExprPtr t, BinaryOp o, ExprPtr v)
        : Stmt(StmtKind::AugAssign, l), target(std::move(t)), op(o), value(std::move(v))
    {
    }
};

/// @brief `if`/`elif` chain; elif clauses are nested IfStmt in orelse.
struct IfStmt : Stmt
{
    ExprPtr condition;
    StmtList body;
    StmtList orelse;

    IfStmt(SourceLoc l, ExprPtr c) : Stmt(StmtKind::If, l), condition(std::move(c)) {}
};

struct WhileStmt : Stmt
{
    ExprPtr condition;
    StmtList body;
    StmtList orelse;

    WhileStmt(SourceLoc l, ExprPtr c) : Stmt(StmtKind::While, l), condition(std::move(c)) {}
};

struct ForStmt : Stmt
{
    ExprPtr target;
    ExprPtr iterable;
    StmtList body;
    StmtList orelse;

    ForStmt(SourceLoc l, ExprPtr t, ExprPtr i)
        : Stmt(StmtKind::For, l), target(std::move(t)), iterable(std::move(i))
    {
    }
};

struct SimpleStmt : Stmt
{
    using Stmt::Stmt;
};

struct ReturnStmt : Stmt
{
    ExprPtr value; ///< Null for bare `return`.

    ReturnStmt(SourceLoc l, ExprPtr v) : Stmt(StmtKind::Return, l), value(std::move(v)) {}
};

struct Param
{
    std::string name;
    ExprPtr defaultValue;
};

struct FunctionDefStmt : Stmt
{
    std::string name;
    std::vector<Param> params;
    StmtList body;

    FunctionDefStmt(SourceLoc l, std::string n) : Stmt(StmtKind::FunctionDef, l), name(std::move(n)) {}
};

struct GlobalStmt : Stmt
{
    std::vector<std::string> names;

    explicit GlobalStmt(SourceLoc l) : Stmt(StmtKind::Global, l) {}
};

/// @brief `import a.b as c`.
struct ImportAlias
{
    std::string module; ///< Dotted module path (or imported name for ImportFrom).
    std::string asName; ///< Empty when no alias was given.
};

struct ImportStmt : Stmt
{
    std::vector<ImportAlias> names;

    explicit ImportStmt(SourceLoc l) : Stmt(StmtKind::Import, l) {}
};

/// @brief `from module import a as b, c`.
struct ImportFromStmt : Stmt
{
    std::string module;
    std::vector<ImportAlias> names; ///< `*` is stored as a single "*" entry.

    ImportFromStmt(SourceLoc l, std::string m) : Stmt(StmtKind::ImportFrom, l), module(std::move(m)) {}
};

struct ExceptHandler
{
    SourceLoc loc;
    ExprPtr type; ///< Null catches everything; may be a tuple of names.
    std::string name;
    StmtList body;
};

struct TryStmt : Stmt
{
    StmtList body;
    std::vector<ExceptHandler> handlers;
    StmtList orelse;
    StmtList finalbody;

    explicit TryStmt(SourceLoc l) : Stmt(StmtKind::Try, l) {}
};

struct RaiseStmt : Stmt
{
    ExprPtr exception; ///< Null re-raises the active exception.

    RaiseStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Raise, l), exception(std::move(e)) {}
};

struct DelStmt : Stmt
{
    ExprList targets;

    DelStmt(SourceLoc l, ExprList t) : Stmt(StmtKind::Del, l), targets(std::move(t)) {}
};

} // namespace fusion::frontends::py
