//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Dispatcher.cpp
// Purpose: Block-by-block execution loop with printf resolution, output
//          streaming and status accounting.
// Key invariants: Every executed block yields exactly one BlockOutcome and
//                 its output reaches the sink before the next block starts.
// Ownership/Lifetime: See header.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#include "exec/Dispatcher.hpp"

#include "exec/Printf.hpp"
#include "exec/Trace.hpp"
#include "vm/NativeError.hpp"

#include <optional>

namespace fusion::exec
{

namespace
{

using Clock = std::chrono::steady_clock;

double millisSince(Clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

/// @brief First non-empty line of @p text.
std::string headline(const std::string &text)
{
    size_t pos = 0;
    while (pos < text.size())
    {
        size_t nl = text.find('\n', pos);
        if (nl == std::string::npos)
            nl = text.size();
        if (text.find_first_not_of(" \t\r", pos) < nl)
            return text.substr(pos, nl - pos);
        pos = nl + 1;
    }
    return {};
}

} // namespace

Dispatcher::Dispatcher(ExecutorRegistry &registry, DispatchOptions options)
    : registry_(registry), options_(options)
{
}

void Dispatcher::preload(const frontends::lf::Program &program, vm::Environment &environment, ExecutionResult &result)
{
    const auto imports = program.nativeImports();
    if (imports.empty())
        return;

    NativeExecutor *native = registry_.native();
    for (const auto &module : imports)
    {
        uint32_t line = 0;
        auto it = program.directives.find(std::string(frontends::lf::kNativeImportDirective));
        if (it != program.directives.end())
        {
            for (const auto &d : it->second)
            {
                if (d.value == module)
                {
                    line = d.line;
                    break;
                }
            }
        }
        if (!native)
        {
            result.diagnostics.report(support::makeWarning(
                "ImportError", locFor(line), "no native executor to import '" + module + "'"));
            continue;
        }
        auto loaded = native->preload(module, line, environment);
        if (!loaded)
        {
            support::Diagnostic d = loaded.error();
            d.loc.file_id = options_.fileId;
            result.diagnostics.report(std::move(d));
        }
    }
}

bool Dispatcher::preparePrintf(LanguageExecutor &executor,
                               BlockRequest &request,
                               vm::Environment &environment,
                               ExecutionOutcome &outcome)
{
    NativeExecutor *native = registry_.native();
    if (!native)
        return false;

    const PrintfEvaluator evaluate = [&](const std::string &expression) {
        return native->tryEvaluate(expression, request.line, environment, options_.nativeTimeout, options_.cancel);
    };

    try
    {
        PrintfRewrite rewrite = rewritePrintf(request.code, executor.language(), evaluate);
        if (rewrite.inlineText && executor.inlinePrintf())
        {
            outcome.status = BlockStatus::Ok;
            outcome.out = *rewrite.inlineText;
            return true;
        }
        request.code = std::move(rewrite.code);
        return false;
    }
    catch (const PrintfError &e)
    {
        outcome.status = BlockStatus::Error;
        outcome.category = "PrintfError";
        outcome.err = std::string("printf: ") + e.what() + "\n";
    }
    catch (const vm::NativeTrap &trap)
    {
        vm::NativeError error = trap.error();
        if (error.line == 0)
            error.line = request.line;
        outcome.status = error.kind == vm::NativeErrorKind::Cancelled ? BlockStatus::Cancelled : BlockStatus::Error;
        outcome.category = std::string(vm::toString(error.kind));
        outcome.err = vm::formatNativeError(error) + " (printf argument)\n";
        outcome.nativeError = std::move(error);
    }
    return true;
}

ExecutionResult Dispatcher::run(const frontends::lf::Program &program, const security::SecurityReport &report)
{
    const auto start = Clock::now();
    ExecutionResult result;
    TraceSink *trace = options_.trace;

    auto finish = [&](RunStatus status) {
        result.status = status;
        result.wallSeconds = std::chrono::duration<double>(Clock::now() - start).count();
        if (trace)
            trace->onRunEnd(toString(status), result.blocks.size(), result.wallSeconds * 1000.0);
    };

    if (report.blocked())
    {
        for (const auto *f : report.blocking())
        {
            support::Diagnostic d{support::Severity::Error,
                                  f->ruleId + ": " + f->message + " (" +
                                      std::string(security::toString(f->severity)) + ")",
                                  locFor(f->line),
                                  "SecurityViolation",
                                  f->block};
            result.diagnostics.report(std::move(d));
        }
        finish(RunStatus::SecurityViolation);
        return result;
    }

    vm::Environment environment;
    preload(program, environment, result);

    bool sawErrors = false;
    std::optional<RunStatus> stop;
    for (size_t i = 0; i < program.blocks.size() && !stop; ++i)
    {
        const auto &block = program.blocks[i];
        if (common::isCancelled(options_.cancel))
        {
            stop = RunStatus::Cancelled;
            break;
        }

        LanguageExecutor *executor = registry_.find(block.tag);
        if (!executor)
        {
            result.diagnostics.report(support::Diagnostic{
                support::Severity::Error,
                "no executor registered for '" + std::string(frontends::lf::toString(block.tag)) + "'",
                locFor(block.line), "ToolchainUnavailable", i});
            stop = RunStatus::Halted;
            break;
        }

        const bool isNative = executor->kind() == ExecutorKind::Native;
        BlockRequest request;
        request.code = block.content;
        request.line = block.line;
        request.blockIndex = i;
        request.timeout = isNative ? options_.nativeTimeout : options_.blockTimeout;
        request.cancel = options_.cancel;

        const auto blockStart = Clock::now();
        ExecutionOutcome outcome;
        bool handled = false;
        if (!isNative)
            handled = preparePrintf(*executor, request, environment, outcome);
        if (trace)
            trace->onBlockStart(i, block.line, block.tag, handled ? "inline" : executor->name());
        if (!handled)
            outcome = executor->execute(request, environment);

        BlockOutcome record;
        record.block = i;
        record.line = block.line;
        record.tag = block.tag;
        record.status = outcome.status;
        record.out = outcome.out;
        record.err = outcome.err;
        record.category = outcome.category;
        if (outcome.environmentDelta)
            record.delta = *outcome.environmentDelta;
        record.elapsedMs = millisSince(blockStart);

        if (options_.out && !outcome.out.empty())
            options_.out->write(outcome.out.data(), static_cast<std::streamsize>(outcome.out.size())).flush();
        if (options_.err && !outcome.err.empty() && outcome.status != BlockStatus::Stub)
            options_.err->write(outcome.err.data(), static_cast<std::streamsize>(outcome.err.size())).flush();
        result.output += outcome.out;
        ++result.perLanguage[block.tag];
        if (trace)
            trace->onBlockEnd(i, toString(outcome.status), record.elapsedMs);

        const uint32_t errorLine =
            outcome.nativeError && outcome.nativeError->line != 0 ? outcome.nativeError->line : block.line;
        const std::string category = outcome.category.empty() ? "ExecutionError" : outcome.category;
        switch (outcome.status)
        {
            case BlockStatus::Ok:
                break;
            case BlockStatus::Stub:
                result.diagnostics.report(support::Diagnostic{support::Severity::Warning, outcome.err,
                                                              locFor(block.line), "ToolchainUnavailable", i});
                break;
            case BlockStatus::Error:
            case BlockStatus::Timeout:
            {
                const std::string first = headline(outcome.err);
                const std::string prefix = outcome.status == BlockStatus::Timeout ? "Timeout: " : category + ": ";
                result.diagnostics.report(support::Diagnostic{
                    support::Severity::Error, first.rfind(prefix, 0) == 0 ? first : prefix + first,
                    locFor(errorLine), category == "SyntaxError" ? "SyntaxError" : "ExecutionError", i});
                if (isNative)
                    stop = RunStatus::Halted;
                else
                    sawErrors = true;
                break;
            }
            case BlockStatus::Cancelled:
                stop = RunStatus::Cancelled;
                break;
            case BlockStatus::Unavailable:
                result.diagnostics.report(support::Diagnostic{support::Severity::Error, outcome.err,
                                                              locFor(block.line), "ToolchainUnavailable", i});
                stop = RunStatus::Halted;
                break;
        }
        result.blocks.push_back(std::move(record));
    }

    result.variables = environment.snapshot();
    finish(stop.value_or(sawErrors ? RunStatus::CompletedWithErrors : RunStatus::Completed));
    return result;
}

} // namespace fusion::exec
