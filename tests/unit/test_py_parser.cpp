// File: tests/unit/test_py_parser.cpp
// Purpose: Check that native blocks parse into the expected statement and
//          expression trees with .lf line numbers.
// Key invariants: Statement locations are offset by the block's first line;
//                 a syntax error yields no module and one diagnostic.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/frontends/py/Parser.cpp, src/frontends/py/Lexer.cpp

#include "frontends/py/AST.hpp"
#include "frontends/py/Parser.hpp"
#include "support/diagnostics.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace fusion::frontends::py;

TEST(PyParser, FunctionDefinitionWithDefaults)
{
    fusion::support::DiagnosticEngine diag;
    auto module = parseNativeSource("def greet(name, punct='!'):\n"
                                    "    return 'hi ' + name + punct\n",
                                    1,
                                    5,
                                    diag);
    ASSERT_NE(module, nullptr);
    EXPECT_EQ(diag.errorCount(), 0u);
    ASSERT_EQ(module->body.size(), 1u);

    const Stmt &stmt = *module->body[0];
    ASSERT_EQ(stmt.kind, StmtKind::FunctionDef);
    EXPECT_EQ(stmt.loc.line, 5u);

    const auto &def = static_cast<const FunctionDefStmt &>(stmt);
    EXPECT_EQ(def.name, "greet");
    ASSERT_EQ(def.params.size(), 2u);
    EXPECT_EQ(def.params[0].defaultValue, nullptr);
    EXPECT_NE(def.params[1].defaultValue, nullptr);
    ASSERT_EQ(def.body.size(), 1u);
    EXPECT_EQ(def.body[0]->kind, StmtKind::Return);
    EXPECT_EQ(def.body[0]->loc.line, 6u);
}

TEST(PyParser, ImportAliases)
{
    fusion::support::DiagnosticEngine diag;
    auto module = parseNativeSource("import os.path as p, sys\nfrom math import sqrt as root\n", 1, 1, diag);
    ASSERT_NE(module, nullptr);
    ASSERT_EQ(module->body.size(), 2u);

    const auto &imp = static_cast<const ImportStmt &>(*module->body[0]);
    ASSERT_EQ(imp.names.size(), 2u);
    EXPECT_EQ(imp.names[0].module, "os.path");
    EXPECT_EQ(imp.names[0].asName, "p");
    EXPECT_EQ(imp.names[1].module, "sys");
    EXPECT_TRUE(imp.names[1].asName.empty());

    ASSERT_EQ(module->body[1]->kind, StmtKind::ImportFrom);
    const auto &from = static_cast<const ImportFromStmt &>(*module->body[1]);
    EXPECT_EQ(from.module, "math");
    ASSERT_EQ(from.names.size(), 1u);
    EXPECT_EQ(from.names[0].module, "sqrt");
    EXPECT_EQ(from.names[0].asName, "root");
}

TEST(PyParser, CompoundStatementsNest)
{
    fusion::support::DiagnosticEngine diag;
    auto module = parseNativeSource("for i in range(3):\n"
                                    "    if i % 2 == 0:\n"
                                    "        total += i\n"
                                    "    else:\n"
                                    "        pass\n"
                                    "try:\n"
                                    "    x = [n * n for n in range(4) if n]\n"
                                    "except ValueError as e:\n"
                                    "    raise\n",
                                    1,
                                    1,
                                    diag);
    ASSERT_NE(module, nullptr);
    ASSERT_EQ(module->body.size(), 2u);
    EXPECT_EQ(module->body[0]->kind, StmtKind::For);
    EXPECT_EQ(module->body[1]->kind, StmtKind::Try);
    EXPECT_EQ(module->body[1]->loc.line, 6u);
}

TEST(PyParser, LoopTargetsStopBeforeIn)
{
    fusion::support::DiagnosticEngine diag;
    auto module = parseNativeSource("for key, value in pairs:\n"
                                    "    pass\n",
                                    1,
                                    1,
                                    diag);
    ASSERT_NE(module, nullptr);
    EXPECT_EQ(diag.errorCount(), 0u);
    ASSERT_EQ(module->body.size(), 1u);
    const auto &loop = static_cast<const ForStmt &>(*module->body[0]);
    ASSERT_EQ(loop.target->kind, ExprKind::Tuple);
    EXPECT_EQ(static_cast<const TupleExpr &>(*loop.target).elements.size(), 2u);
    ASSERT_EQ(loop.iterable->kind, ExprKind::Name);
    EXPECT_EQ(static_cast<const NameExpr &>(*loop.iterable).name, "pairs");

    auto comp = parseNativeExpression("[n for n in xs if n in allowed]", 1, 1, diag);
    ASSERT_NE(comp, nullptr);
    ASSERT_EQ(comp->kind, ExprKind::ListComp);
    const auto &list = static_cast<const ListCompExpr &>(*comp);
    ASSERT_EQ(list.target->kind, ExprKind::Name);
    EXPECT_EQ(static_cast<const NameExpr &>(*list.target).name, "n");
    ASSERT_EQ(list.conditions.size(), 1u);
    EXPECT_EQ(list.conditions[0]->kind, ExprKind::Compare);
    EXPECT_EQ(diag.errorCount(), 0u);
}

TEST(PyParser, SyntaxErrorYieldsNoModule)
{
    fusion::support::DiagnosticEngine diag;
    auto module = parseNativeSource("x = 1\ny = = 2\n", 1, 3, diag);
    EXPECT_EQ(module, nullptr);
    ASSERT_EQ(diag.errorCount(), 1u);
    EXPECT_EQ(diag.diagnostics()[0].loc.line, 4u);
}

TEST(PyParser, ExpressionOnly)
{
    fusion::support::DiagnosticEngine diag;
    auto expr = parseNativeExpression("obj.method(a, key=1)[0]", 1, 2, diag);
    ASSERT_NE(expr, nullptr);
    EXPECT_EQ(expr->kind, ExprKind::Subscript);

    fusion::support::DiagnosticEngine bad;
    EXPECT_EQ(parseNativeExpression("a b", 1, 2, bad), nullptr);
    EXPECT_GE(bad.errorCount(), 1u);
}
