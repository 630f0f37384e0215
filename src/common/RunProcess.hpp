//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/RunProcess.hpp
// Purpose: Launch a child process with captured stdout/stderr, a wall-clock
//          timeout and cooperative cancellation.
// Key invariants: A child that outlives its timeout or is cancelled is killed
//                 together with its process group before run_process returns.
// Ownership/Lifetime: Callers own argument buffers; the helper copies them.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/Cancellation.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fusion::common
{

/// @brief Result of launching a subprocess.
struct RunResult
{
    int exit_code = -1;         ///< Exit status, 128+signal when killed, -1 on launch failure.
    std::string out;            ///< Captured standard output text.
    std::string err;            ///< Captured standard error text.
    bool timed_out = false;     ///< Child exceeded the configured timeout.
    bool cancelled = false;     ///< Child was killed because the run was cancelled.
    bool launch_failed = false; ///< The executable could not be started.
};

/// @brief Knobs controlling a single launch.
struct RunOptions
{
    std::optional<std::string> cwd;                        ///< Working directory of the child.
    std::vector<std::pair<std::string, std::string>> env;  ///< Environment overrides.
    std::chrono::milliseconds timeout{0};                  ///< 0 disables the timeout.
    const CancelToken *cancel = nullptr;                   ///< Optional cancellation flag.
    std::string input;                                     ///< Text written to the child's stdin.
};

/// @brief Spawn @p argv[0] with arguments and wait for completion.
/// @details The executable is resolved through PATH when it contains no slash.
///          Output beyond kMaxCapturedBytes per stream is discarded.
RunResult run_process(const std::vector<std::string> &argv, const RunOptions &options);

/// @brief Spawn a subprocess without timeout or cancellation.
RunResult run_process(const std::vector<std::string> &argv,
                      std::optional<std::string> cwd = std::nullopt,
                      const std::vector<std::pair<std::string, std::string>> &env = {});

/// @brief Per-stream capture limit.
inline constexpr size_t kMaxCapturedBytes = 8u * 1024u * 1024u;

} // namespace fusion::common
