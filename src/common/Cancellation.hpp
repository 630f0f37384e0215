//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/Cancellation.hpp
// Purpose: Shared cancellation flag observed by the dispatcher, the native
//          interpreter and the process launcher.
// Key invariants: Once set, the flag never resets.
// Ownership/Lifetime: Owned by the caller that starts a run; observers hold
//                     non-owning pointers for the duration of the run.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>

namespace fusion::common
{

/// @brief One-shot cancellation request shared across a single run.
class CancelToken
{
  public:
    /// @brief Request cancellation; safe to call from a signal handler.
    void cancel() noexcept
    {
        flag_.store(true, std::memory_order_relaxed);
    }

    [[nodiscard]] bool cancelled() const noexcept
    {
        return flag_.load(std::memory_order_relaxed);
    }

  private:
    std::atomic<bool> flag_{false};
};

/// @brief Convenience check that tolerates a null token.
inline bool isCancelled(const CancelToken *token) noexcept
{
    return token != nullptr && token->cancelled();
}

} // namespace fusion::common
