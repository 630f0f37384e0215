//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Fwd.hpp
/// @brief Forward declarations and owning pointer aliases for the native AST.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <memory>
#include <vector>

namespace fusion::frontends::py
{

using support::SourceLoc;

struct Expr;
struct Stmt;
struct Module;

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using ExprList = std::vector<ExprPtr>;
using StmtList = std::vector<StmtPtr>;

} // namespace fusion::frontends::py
