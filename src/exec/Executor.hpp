//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Executor.hpp
// Purpose: Contract shared by the native and subprocess language executors.
// Key invariants: Only executors of kind Native modify the environment
//                 they are handed; subprocess executors read a snapshot of
//                 it and never write back.
// Ownership/Lifetime: Executors are owned by an ExecutorRegistry; the
//                     environment is owned by the dispatcher for one run.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/Cancellation.hpp"
#include "frontends/lf/LanguageTag.hpp"
#include "vm/Environment.hpp"
#include "vm/NativeError.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fusion::exec
{

using frontends::lf::LanguageTag;

enum class ExecutorKind
{
    Native,
    Subprocess,
};

/// @brief How a single block finished.
enum class BlockStatus
{
    Ok,          ///< Ran to completion.
    Stub,        ///< Toolchain missing; block rendered as text instead.
    Error,       ///< Compile, runtime or marshalling failure.
    Timeout,     ///< Exceeded its time or step budget.
    Cancelled,   ///< The run was cancelled while the block was active.
    Unavailable, ///< Toolchain missing and stub fallback disabled.
};

constexpr std::string_view toString(BlockStatus s)
{
    switch (s)
    {
        case BlockStatus::Ok:
            return "ok";
        case BlockStatus::Stub:
            return "stub";
        case BlockStatus::Error:
            return "error";
        case BlockStatus::Timeout:
            return "timeout";
        case BlockStatus::Cancelled:
            return "cancelled";
        case BlockStatus::Unavailable:
            return "unavailable";
    }
    return "?";
}

/// @brief One block handed to an executor.
struct BlockRequest
{
    std::string code;
    uint32_t line = 0;
    size_t blockIndex = 0;
    std::chrono::milliseconds timeout{10000};
    const common::CancelToken *cancel = nullptr;
};

/// @brief Result of executing one block.
struct ExecutionOutcome
{
    BlockStatus status = BlockStatus::Ok;
    std::string out;
    std::string err;
    /// @brief Error category for failures, e.g. "CompileError" or "MarshalError".
    std::string category;
    /// @brief Names the block created or changed; native executors only.
    std::optional<std::vector<std::string>> environmentDelta;
    /// @brief Guest exception that ended a native block.
    std::optional<vm::NativeError> nativeError;

    bool succeeded() const
    {
        return status == BlockStatus::Ok || status == BlockStatus::Stub;
    }
};

/// @brief A language runtime able to execute blocks of one guest language.
class LanguageExecutor
{
  public:
    virtual ~LanguageExecutor() = default;

    virtual LanguageTag language() const = 0;

    virtual ExecutorKind kind() const = 0;

    /// @brief Short name used in traces, e.g. "native" or "subprocess:node".
    virtual std::string name() const = 0;

    /// @brief Whether the toolchain is present; always true for native.
    virtual bool available() = 0;

    /// @brief Whether a block made of a single rewritten printf call may be
    ///        printed in-process instead of invoking the toolchain.
    virtual bool inlinePrintf() const
    {
        return false;
    }

    /// @brief Execute @p request against @p environment.
    virtual ExecutionOutcome execute(const BlockRequest &request, vm::Environment &environment) = 0;
};

} // namespace fusion::exec
