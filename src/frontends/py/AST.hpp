//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Root node of the native-language AST plus a generic walker.
///
/// A Module is the parse of one native code block. Modules are shared
/// (shared_ptr) because function values created while executing a block keep
/// pointing into the block's statements after the block finishes.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/py/AST_Expr.hpp"
#include "frontends/py/AST_Stmt.hpp"


namespace fusion::frontends::py
{

struct Module
{
    StmtList body;
};

/// @brief Read-only pre-order traversal over statements and expressions.
class AstVisitor
{
  public:
    virtual ~AstVisitor() = default;

    /// @brief Called for every statement before its children.
    virtual void visitStmt(const Stmt &) {}

    /// @brief Called for every expression before its children.
    virtual void visitExpr(const Expr &) {}

    void walk(const Module &module);
    void walk(const Stmt &stmt);
    void walk(const Expr &expr);

  protected:
    void walkAll(const StmtList &list);
};

} // namespace fusion::frontends::py
