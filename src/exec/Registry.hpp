//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Registry.hpp
// Purpose: Map from language tag to the executor that runs its blocks.
// Key invariants: At most one executor per tag; the native executor, when
//                 registered, is also reachable through native().
// Ownership/Lifetime: Owns its executors and the toolchain resolver they
//                     share. Not copyable or movable because executors keep
//                     a reference to the resolver.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "exec/Executor.hpp"
#include "exec/NativeExecutor.hpp"
#include "exec/RunConfig.hpp"
#include "exec/Toolchain.hpp"

#include <map>
#include <memory>
#include <string>

namespace fusion::exec
{

class TraceSink;

class ExecutorRegistry
{
  public:
    explicit ExecutorRegistry(std::map<std::string, std::string> toolOverrides = {}, TraceSink *trace = nullptr);

    ExecutorRegistry(const ExecutorRegistry &) = delete;
    ExecutorRegistry &operator=(const ExecutorRegistry &) = delete;

    /// @brief Register @p executor, replacing any executor for its tag.
    void add(std::unique_ptr<LanguageExecutor> executor);

    /// @brief Executor for @p tag, or nullptr.
    LanguageExecutor *find(LanguageTag tag) const;

    NativeExecutor *native() const
    {
        return native_;
    }

    ToolchainResolver &resolver()
    {
        return resolver_;
    }

    /// @brief Registry with the native executor and one subprocess executor
    ///        per guest language, configured from @p config.
    static std::unique_ptr<ExecutorRegistry> standard(const RunConfig &config, TraceSink *trace = nullptr);

  private:
    ToolchainResolver resolver_;
    std::map<LanguageTag, std::unique_ptr<LanguageExecutor>> executors_;
    NativeExecutor *native_ = nullptr;
};

} // namespace fusion::exec
