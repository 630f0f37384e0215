//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/NativeExecutor.cpp
// Purpose: Run native blocks and expressions through the interpreter.
// Key invariants: Output produced before a guest error is preserved in the
//                 outcome; the environment delta is always reported.
// Ownership/Lifetime: See NativeExecutor.hpp.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#include "exec/NativeExecutor.hpp"

#include "frontends/py/Parser.hpp"
#include "vm/Builtins.hpp"
#include "vm/Interpreter.hpp"

#include <set>

namespace fusion::exec
{

namespace
{

/// @brief First diagnostic message of a failed parse.
std::string firstMessage(const support::DiagnosticEngine &diag, uint32_t &line)
{
    for (const auto &d : diag.diagnostics())
    {
        if (d.severity == support::Severity::Error)
        {
            if (d.loc.line != 0)
                line = d.loc.line;
            return d.message;
        }
    }
    return "invalid syntax";
}

BlockStatus statusFor(vm::NativeErrorKind kind)
{
    switch (kind)
    {
        case vm::NativeErrorKind::Timeout:
            return BlockStatus::Timeout;
        case vm::NativeErrorKind::Cancelled:
            return BlockStatus::Cancelled;
        default:
            return BlockStatus::Error;
    }
}

/// @brief Names an expression reads without binding them itself.
class FreeNames final : public frontends::py::AstVisitor
{
  public:
    void visitExpr(const frontends::py::Expr &expr) override
    {
        using frontends::py::ExprKind;
        switch (expr.kind)
        {
            case ExprKind::Name:
                used.insert(static_cast<const frontends::py::NameExpr &>(expr).name);
                break;
            case ExprKind::Lambda:
                for (const auto &p : static_cast<const frontends::py::LambdaExpr &>(expr).params)
                    bound.insert(p);
                break;
            case ExprKind::ListComp:
            {
                const auto &comp = static_cast<const frontends::py::ListCompExpr &>(expr);
                bindTarget(*comp.target);
                break;
            }
            default:
                break;
        }
    }

    std::set<std::string> used;
    std::set<std::string> bound;

  private:
    void bindTarget(const frontends::py::Expr &target)
    {
        using frontends::py::ExprKind;
        if (target.kind == ExprKind::Name)
            bound.insert(static_cast<const frontends::py::NameExpr &>(target).name);
        else if (target.kind == ExprKind::Tuple)
            for (const auto &e : static_cast<const frontends::py::TupleExpr &>(target).elements)
                bindTarget(*e);
    }
};

} // namespace

NativeExecutor::NativeExecutor(NativeLimits limits) : limits_(limits) {}

vm::InterpreterLimits NativeExecutor::limitsFor(std::chrono::milliseconds timeout) const
{
    vm::InterpreterLimits l;
    l.timeout = timeout;
    l.maxSteps = limits_.maxSteps;
    l.maxCallDepth = limits_.maxCallDepth;
    return l;
}

ExecutionOutcome NativeExecutor::execute(const BlockRequest &request, vm::Environment &environment)
{
    ExecutionOutcome outcome;

    support::DiagnosticEngine diag;
    auto module = frontends::py::parseNativeSource(request.code, 0, request.line, diag);
    if (!module)
    {
        uint32_t line = request.line;
        std::string message = firstMessage(diag, line);
        vm::NativeError error{vm::NativeErrorKind::SyntaxError, std::move(message), line};
        outcome.status = BlockStatus::Error;
        outcome.category = "SyntaxError";
        outcome.err = vm::formatNativeError(error) + "\n";
        outcome.nativeError = std::move(error);
        outcome.environmentDelta = std::vector<std::string>{};
        return outcome;
    }

    environment.beginDelta();
    vm::Interpreter interp(environment, limitsFor(request.timeout), request.cancel);
    try
    {
        interp.execute(module);
    }
    catch (const vm::NativeTrap &trap)
    {
        vm::NativeError error = trap.error();
        if (error.line == 0)
            error.line = request.line;
        outcome.status = statusFor(error.kind);
        outcome.category = std::string(vm::toString(error.kind));
        outcome.err = vm::formatNativeError(error) + "\n";
        outcome.nativeError = std::move(error);
    }
    outcome.out = interp.takeOutput();
    outcome.environmentDelta = environment.takeDelta();
    return outcome;
}

support::Expected<void> NativeExecutor::preload(const std::string &module, uint32_t line, vm::Environment &environment)
{
    vm::Interpreter interp(environment, limitsFor(std::chrono::milliseconds(1000)), nullptr);
    try
    {
        interp.importModule(module, module.substr(0, module.find('.')));
    }
    catch (const vm::NativeTrap &trap)
    {
        return support::makeWarning("ImportError", support::SourceLoc{0, line, 0}, trap.error().message);
    }
    return {};
}

vm::Value NativeExecutor::evaluate(std::string_view expression,
                                   uint32_t line,
                                   vm::Environment &environment,
                                   std::chrono::milliseconds timeout,
                                   const common::CancelToken *cancel)
{
    support::DiagnosticEngine diag;
    auto expr = frontends::py::parseNativeExpression(expression, 0, line, diag);
    if (!expr)
    {
        uint32_t at = line;
        std::string message = firstMessage(diag, at);
        throw vm::NativeTrap(vm::NativeError{vm::NativeErrorKind::SyntaxError, std::move(message), at});
    }
    vm::Interpreter interp(environment, limitsFor(timeout), cancel);
    try
    {
        return interp.evaluate(*expr);
    }
    catch (vm::NativeTrap &trap)
    {
        trap.setLineIfUnknown(line);
        throw;
    }
}

std::optional<vm::Value> NativeExecutor::tryEvaluate(std::string_view expression,
                                                      uint32_t line,
                                                      vm::Environment &environment,
                                                      std::chrono::milliseconds timeout,
                                                      const common::CancelToken *cancel)
{
    support::DiagnosticEngine diag;
    auto expr = frontends::py::parseNativeExpression(expression, 0, line, diag);
    if (!expr)
        return std::nullopt;

    FreeNames names;
    names.walk(*expr);
    const auto &builtins = vm::builtinTable();
    for (const auto &name : names.used)
    {
        if (names.bound.count(name) || environment.contains(name) || builtins.count(name))
            continue;
        throw vm::NativeTrap(
            vm::NativeError{vm::NativeErrorKind::NameError, "name '" + name + "' is not defined", line});
    }

    vm::Interpreter interp(environment, limitsFor(timeout), cancel);
    try
    {
        return interp.evaluate(*expr);
    }
    catch (vm::NativeTrap &trap)
    {
        trap.setLineIfUnknown(line);
        throw;
    }
}

} // namespace fusion::exec
