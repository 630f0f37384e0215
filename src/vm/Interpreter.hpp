//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Interpreter.hpp
// Purpose: Tree-walking interpreter for native blocks.
// Key invariants: Each statement costs one step; exceeding the step budget
//                 or the wall-clock deadline raises Timeout, a set cancel
//                 token raises Cancelled. Neither can be caught by guest code.
// Ownership/Lifetime: Borrows the Environment and the cancel token; both
//                     must outlive the interpreter. One interpreter serves
//                     one block.
// Links: docs/native-language.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/Cancellation.hpp"
#include "frontends/py/AST.hpp"
#include "vm/Environment.hpp"
#include "vm/Value.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace fusion::vm
{

struct SliceBounds;

/// @brief Resource bounds applied to one interpreter instance.
struct InterpreterLimits
{
    std::chrono::milliseconds timeout{10000};
    uint64_t maxSteps = 10'000'000;
    unsigned maxCallDepth = 400;
};

/// @brief Local scope of one function activation.
struct Frame
{
    std::unordered_map<std::string, Value> locals;
    std::unordered_set<std::string> globals; ///< Names declared `global`.
    std::shared_ptr<Frame> parent;           ///< Lexically enclosing scope.
};

class Interpreter
{
  public:
    Interpreter(Environment &env,
                InterpreterLimits limits = {},
                const common::CancelToken *cancel = nullptr);

    /// @brief Run a parsed block at module scope.
    /// @throws NativeTrap on any guest error, timeout or cancellation.
    void execute(const std::shared_ptr<const frontends::py::Module> &module);

    /// @brief Evaluate one expression against the global namespace.
    /// @throws NativeTrap on guest errors.
    Value evaluate(const frontends::py::Expr &expr);

    /// @brief Bind sandbox module @p module as @p bindAs in the current scope.
    /// @throws NativeTrap with ImportError for modules outside the sandbox.
    void importModule(const std::string &module, const std::string &bindAs);

    /// @brief Invoke any callable value.
    Value call(const Value &callee, ValueList args, KeywordArgs kwargs = {});

    /// @brief Append text to the captured standard output.
    void write(std::string_view text);

    const std::string &output() const noexcept
    {
        return output_;
    }

    std::string takeOutput()
    {
        return std::move(output_);
    }

    uint64_t steps() const noexcept
    {
        return steps_;
    }

    /// @brief Raise Timeout/Cancelled when a limit has been reached.
    void checkLimits();

    Environment &environment() noexcept
    {
        return env_;
    }

  private:
    enum class Flow
    {
        Normal,
        Break,
        Continue,
        Return,
    };

    using Stmt = frontends::py::Stmt;
    using Expr = frontends::py::Expr;
    using StmtList = frontends::py::StmtList;

    // Statements (Interpreter.cpp)
    Flow execBlock(const StmtList &body);
    Flow execStmt(const Stmt &stmt);
    Flow execStmtKind(const Stmt &stmt);
    Flow execFor(const frontends::py::ForStmt &stmt);
    Flow execWhile(const frontends::py::WhileStmt &stmt);
    Flow execTry(const frontends::py::TryStmt &stmt);
    Flow execTryBody(const frontends::py::TryStmt &stmt);
    void execRaise(const frontends::py::RaiseStmt &stmt);
    void execImport(const frontends::py::ImportStmt &stmt);
    void execImportFrom(const frontends::py::ImportFromStmt &stmt);
    void execAugAssign(const frontends::py::AugAssignStmt &stmt);
    void defineFunction(const frontends::py::FunctionDefStmt &stmt);
    bool handlerMatches(const frontends::py::ExceptHandler &handler, NativeErrorKind kind);
    Value loadModule(const std::string &name);

    // Expressions (Interpreter_Expr.cpp)
    Value eval(const Expr &expr);
    Value evalCall(const frontends::py::CallExpr &call);
    Value evalCompare(const frontends::py::CompareExpr &cmp);
    Value evalSubscript(const frontends::py::SubscriptExpr &sub);
    Value evalFString(const frontends::py::FStringExpr &fstr);
    Value evalListComp(const frontends::py::ListCompExpr &comp);
    Value makeLambda(const frontends::py::LambdaExpr &lambda);
    Value getAttribute(const Value &object, const std::string &attr);
    SliceBounds evalSliceBounds(const frontends::py::SliceExpr &slice);
    void assign(const Expr &target, Value value);
    void deleteTarget(const Expr &target);
    void markMutated(const Expr &target);

    // Scopes and calls (Interpreter_Call.cpp)
    Value lookupName(const std::string &name);
    void storeName(const std::string &name, Value value);
    void deleteName(const std::string &name);
    Value callFunction(const FunctionObject &fn, ValueList &args, KeywordArgs &kwargs);
    bool isLocal(const std::string &name) const;
    void tick();

    /// @brief Installs a scope for the lifetime of the guard.
    class FrameScope
    {
      public:
        FrameScope(Interpreter &interp, std::shared_ptr<Frame> frame);
        ~FrameScope();

        FrameScope(const FrameScope &) = delete;
        FrameScope &operator=(const FrameScope &) = delete;

      private:
        Interpreter &interp_;
        std::shared_ptr<Frame> saved_;
    };

    Environment &env_;
    InterpreterLimits limits_;
    const common::CancelToken *cancel_;
    std::chrono::steady_clock::time_point deadline_;
    uint64_t steps_ = 0;
    unsigned callDepth_ = 0;

    std::shared_ptr<Frame> frame_; ///< Null at module scope.
    std::shared_ptr<const void> owner_; ///< AST owner for functions defined now.
    Value returnValue_;
    Value activeException_; ///< Exception being handled, for bare `raise`.
    std::string output_;
};

} // namespace fusion::vm
