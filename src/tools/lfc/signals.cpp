//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Signal handling for `lfc run`. The handler only flips the atomic flag;
// the dispatcher, interpreter and process launcher observe it.
//
//===----------------------------------------------------------------------===//

#include "signals.hpp"

namespace lfc
{

namespace
{

fusion::common::CancelToken *gToken = nullptr;

void onTerminate(int)
{
    if (gToken)
        gToken->cancel();
}

} // namespace

SignalScope::SignalScope(fusion::common::CancelToken &token)
{
    gToken = &token;
    struct sigaction action{};
    action.sa_handler = onTerminate;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, &previousInt_);
    sigaction(SIGTERM, &action, &previousTerm_);
}

SignalScope::~SignalScope()
{
    sigaction(SIGINT, &previousInt_, nullptr);
    sigaction(SIGTERM, &previousTerm_, nullptr);
    gToken = nullptr;
}

} // namespace lfc
