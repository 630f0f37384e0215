//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/lfc/signals.hpp
// Purpose: Route SIGINT and SIGTERM to a run's cancellation token.
// Key invariants: Only one scope may be active at a time; previous handlers
//                 are restored when the scope ends.
// Ownership/Lifetime: The token must outlive the scope.
// Links: docs/lfc.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/Cancellation.hpp"

#include <csignal>

namespace lfc
{

class SignalScope
{
  public:
    explicit SignalScope(fusion::common::CancelToken &token);
    ~SignalScope();

    SignalScope(const SignalScope &) = delete;
    SignalScope &operator=(const SignalScope &) = delete;

  private:
    struct sigaction previousInt_{};
    struct sigaction previousTerm_{};
};

} // namespace lfc
