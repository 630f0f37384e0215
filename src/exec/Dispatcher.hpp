//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Dispatcher.hpp
// Purpose: Run the blocks of a program in order against one shared
//          environment, once the security report allows it.
// Key invariants: Blocks run strictly in source order on one thread. Only
//                 native failures, a missing mandatory toolchain or
//                 cancellation stop the run early.
// Ownership/Lifetime: The dispatcher borrows the registry and the output
//                     streams; each run() owns a fresh environment.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/Cancellation.hpp"
#include "exec/Executor.hpp"
#include "exec/Registry.hpp"
#include "frontends/lf/Program.hpp"
#include "security/SecurityReport.hpp"
#include "support/diagnostics.hpp"
#include "vm/Environment.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace fusion::exec
{

class TraceSink;

enum class RunStatus
{
    Completed,           ///< Every block succeeded (stubs included).
    CompletedWithErrors, ///< Some subprocess blocks failed; the run went on.
    Halted,              ///< A native failure or missing toolchain stopped the run.
    SecurityViolation,   ///< The report blocked execution; nothing ran.
    Cancelled,           ///< Cancellation was requested.
};

constexpr std::string_view toString(RunStatus s)
{
    switch (s)
    {
        case RunStatus::Completed:
            return "completed";
        case RunStatus::CompletedWithErrors:
            return "completed-with-errors";
        case RunStatus::Halted:
            return "halted";
        case RunStatus::SecurityViolation:
            return "security-violation";
        case RunStatus::Cancelled:
            return "cancelled";
    }
    return "?";
}

/// @brief Record of one executed block.
struct BlockOutcome
{
    size_t block = 0;
    uint32_t line = 0;
    LanguageTag tag = LanguageTag::Py;
    BlockStatus status = BlockStatus::Ok;
    std::string out;
    std::string err;
    std::string category;
    std::vector<std::string> delta; ///< Native blocks only.
    double elapsedMs = 0.0;
};

struct ExecutionResult
{
    RunStatus status = RunStatus::Completed;
    std::vector<BlockOutcome> blocks;
    support::DiagnosticEngine diagnostics;
    std::map<LanguageTag, size_t> perLanguage; ///< Blocks executed per language.
    double wallSeconds = 0.0;
    std::string output;                ///< Concatenated standard output.
    vm::Environment::Table variables;  ///< Data bindings left at the end of the run.

    /// @brief Process exit status: 0 when the run completed, 1 otherwise.
    int exitCode() const
    {
        return status == RunStatus::Completed || status == RunStatus::CompletedWithErrors ? 0 : 1;
    }
};

struct DispatchOptions
{
    std::chrono::milliseconds blockTimeout{10000};
    std::chrono::milliseconds nativeTimeout{10000};
    const common::CancelToken *cancel = nullptr;
    std::ostream *out = nullptr; ///< Block stdout as it is produced; optional.
    std::ostream *err = nullptr; ///< Block stderr as it is produced; optional.
    TraceSink *trace = nullptr;
    uint32_t fileId = 0;         ///< Attached to diagnostic locations.
};

class Dispatcher
{
  public:
    Dispatcher(ExecutorRegistry &registry, DispatchOptions options = {});

    /// @brief Execute @p program if @p report does not block it.
    ExecutionResult run(const frontends::lf::Program &program, const security::SecurityReport &report);

  private:
    /// @brief Resolve printf placeholders, or run the call in-process.
    /// @return true when @p outcome already holds the block result.
    bool preparePrintf(LanguageExecutor &executor,
                       BlockRequest &request,
                       vm::Environment &environment,
                       ExecutionOutcome &outcome);

    void preload(const frontends::lf::Program &program, vm::Environment &environment, ExecutionResult &result);

    support::SourceLoc locFor(uint32_t line) const
    {
        return support::SourceLoc{options_.fileId, line, 0};
    }

    ExecutorRegistry &registry_;
    DispatchOptions options_;
};

} // namespace fusion::exec
