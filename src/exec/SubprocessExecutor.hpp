//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/SubprocessExecutor.hpp
// Purpose: Executor that writes a synthesised program to a scratch
//          directory, compiles it when needed and runs it as a child process.
// Key invariants: The environment is only read; nothing flows back from the
//                 child. Every scratch directory is removed before execute()
//                 returns.
// Ownership/Lifetime: Owns its language adapter; borrows the resolver, which
//                     must outlive the executor.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "exec/Executor.hpp"
#include "exec/LanguageAdapters.hpp"
#include "exec/RunConfig.hpp"
#include "exec/Toolchain.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace fusion::exec
{

struct SubprocessOptions
{
    std::chrono::milliseconds compileTimeout{60000};
    FallbackPolicy fallback{FallbackPolicy::Stub};
};

class SubprocessExecutor final : public LanguageExecutor
{
  public:
    SubprocessExecutor(std::unique_ptr<LanguageAdapter> adapter,
                       ToolchainResolver &resolver,
                       SubprocessOptions options = {});

    LanguageTag language() const override
    {
        return adapter_->language();
    }

    ExecutorKind kind() const override
    {
        return ExecutorKind::Subprocess;
    }

    std::string name() const override;

    bool available() override;

    bool inlinePrintf() const override
    {
        return adapter_->inlinePrintf();
    }

    ExecutionOutcome execute(const BlockRequest &request, vm::Environment &environment) override;

  private:
    /// @brief Role to path for every requirement; nullopt when one is missing.
    std::optional<std::map<std::string, std::string>> resolveTools();

    /// @brief Name of the first requirement that cannot be resolved.
    std::string missingTool();

    ExecutionOutcome unavailable(const BlockRequest &request, const std::string &tool) const;

    std::unique_ptr<LanguageAdapter> adapter_;
    ToolchainResolver &resolver_;
    SubprocessOptions options_;
};

/// @brief Text printed for a block whose toolchain is missing.
std::string renderStub(LanguageTag language, uint32_t line, const std::string &tool, const std::string &code);

/// @brief Reduce compiler diagnostics to the first five error lines, with
///        references to @p fileName rewritten as `line N` of the source.
std::string summarizeCompileErrors(const std::string &diagnostics,
                                   const std::string &fileName,
                                   uint32_t blockLine,
                                   uint32_t firstUserLine);

} // namespace fusion::exec
