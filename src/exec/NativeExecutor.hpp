//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/NativeExecutor.hpp
// Purpose: In-process executor for native (py) blocks.
// Key invariants: Each block runs in a fresh Interpreter over the shared
//                 environment; the environment outlives every interpreter.
// Ownership/Lifetime: Stateless between blocks apart from its limits.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "exec/Executor.hpp"
#include "support/diag_expected.hpp"
#include "vm/Interpreter.hpp"
#include "vm/Value.hpp"

#include <optional>
#include <string_view>

namespace fusion::exec
{

/// @brief Budgets applied to every native block; the wall-clock limit comes
///        from the block request.
struct NativeLimits
{
    uint64_t maxSteps = 10'000'000;
    unsigned maxCallDepth = 400;
};

class NativeExecutor final : public LanguageExecutor
{
  public:
    explicit NativeExecutor(NativeLimits limits = {});

    LanguageTag language() const override
    {
        return LanguageTag::Py;
    }

    ExecutorKind kind() const override
    {
        return ExecutorKind::Native;
    }

    std::string name() const override
    {
        return "native";
    }

    bool available() override
    {
        return true;
    }

    /// @brief Parse and run @p request, mutating @p environment in place.
    ExecutionOutcome execute(const BlockRequest &request, vm::Environment &environment) override;

    /// @brief Bind sandbox module @p module in @p environment.
    /// @return ImportError diagnostic when the module is outside the sandbox.
    support::Expected<void> preload(const std::string &module, uint32_t line, vm::Environment &environment);

    /// @brief Evaluate a native expression against @p environment.
    /// @throws vm::NativeTrap on syntax or runtime errors.
    vm::Value evaluate(std::string_view expression,
                       uint32_t line,
                       vm::Environment &environment,
                       std::chrono::milliseconds timeout,
                       const common::CancelToken *cancel);

    /// @brief Evaluate @p expression when it parses as a native expression.
    /// @return nullopt when the expression is not native.
    /// @throws vm::NativeTrap with NameError when a free name is bound
    ///         neither in @p environment nor among the builtins, and on any
    ///         evaluation failure.
    std::optional<vm::Value> tryEvaluate(std::string_view expression,
                                         uint32_t line,
                                         vm::Environment &environment,
                                         std::chrono::milliseconds timeout,
                                         const common::CancelToken *cancel);

  private:
    vm::InterpreterLimits limitsFor(std::chrono::milliseconds timeout) const;

    NativeLimits limits_;
};

} // namespace fusion::exec
