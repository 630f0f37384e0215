//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Registry.cpp
// Purpose: Executor registration and the standard executor set.
// Key invariants: See header.
// Ownership/Lifetime: See header.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#include "exec/Registry.hpp"

#include "exec/SubprocessExecutor.hpp"

namespace fusion::exec
{

ExecutorRegistry::ExecutorRegistry(std::map<std::string, std::string> toolOverrides, TraceSink *trace)
    : resolver_(std::move(toolOverrides), trace)
{
}

void ExecutorRegistry::add(std::unique_ptr<LanguageExecutor> executor)
{
    const LanguageTag tag = executor->language();
    if (executors_.count(tag) && executors_.at(tag).get() == native_)
        native_ = nullptr;
    if (executor->kind() == ExecutorKind::Native)
        native_ = dynamic_cast<NativeExecutor *>(executor.get());
    executors_[tag] = std::move(executor);
}

LanguageExecutor *ExecutorRegistry::find(LanguageTag tag) const
{
    auto it = executors_.find(tag);
    return it == executors_.end() ? nullptr : it->second.get();
}

std::unique_ptr<ExecutorRegistry> ExecutorRegistry::standard(const RunConfig &config, TraceSink *trace)
{
    auto registry = std::make_unique<ExecutorRegistry>(config.toolchains, trace);

    NativeLimits limits;
    limits.maxSteps = config.nativeStepBudget;
    registry->add(std::make_unique<NativeExecutor>(limits));

    SubprocessOptions options;
    options.compileTimeout = config.compileTimeout;
    options.fallback = config.fallback;
    for (LanguageTag tag : frontends::lf::kAllLanguageTags)
    {
        if (frontends::lf::isNative(tag))
            continue;
        registry->add(std::make_unique<SubprocessExecutor>(makeLanguageAdapter(tag), registry->resolver(), options));
    }
    return registry;
}

} // namespace fusion::exec
