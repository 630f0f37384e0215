//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `lfc run`: load or compile a program, scan it and execute its
// blocks, streaming their output.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "signals.hpp"

#include "fusion/api/Fusion.hpp"

#include <iostream>

/// @brief Handle `lfc run <file.lf|file.lsf>`.
/// @return 0 when the run completed (possibly with block errors), 1 when it
///         was blocked, halted or cancelled, 2 on usage errors.
int cmdRun(int argc, char **argv)
{
    lfc::SharedCliOptions shared;
    std::string input;
    for (int i = 0; i < argc; ++i)
    {
        switch (lfc::parseSharedOption(i, argc, argv, shared))
        {
            case lfc::SharedOptionParseResult::Parsed:
                continue;
            case lfc::SharedOptionParseResult::Error:
                lfc::usage();
                return 2;
            case lfc::SharedOptionParseResult::NotMatched:
                break;
        }
        if (!input.empty())
        {
            lfc::usage();
            return 2;
        }
        input = argv[i];
    }
    if (input.empty())
    {
        lfc::usage();
        return 2;
    }

    auto config = lfc::resolveConfig(shared, input);
    if (!config)
    {
        fusion::support::printDiag(config.error(), std::cerr);
        return 1;
    }

    fusion::api::Engine engine(config.value());
    auto loaded = engine.load(input);
    loaded.diagnostics.printAll(std::cerr, &engine.sources());
    if (!loaded.succeeded())
        return 1;
    const auto &program = loaded.artifact->program;

    auto report = engine.scan(program);
    if (!report)
    {
        fusion::support::printDiag(report.error(), std::cerr);
        return 1;
    }
    if (report.value().blocked())
        report.value().render(std::cerr);

    fusion::common::CancelToken cancel;
    lfc::SignalScope signals(cancel);

    fusion::api::RunOptions options;
    options.cancel = &cancel;
    options.out = &std::cout;
    options.err = &std::cerr;
    options.fileId = loaded.fileId;
    const auto result = engine.run(program, report.value(), options);
    std::cout.flush();
    result.diagnostics.printAll(std::cerr, &engine.sources());

    switch (result.status)
    {
        case fusion::exec::RunStatus::Completed:
        case fusion::exec::RunStatus::CompletedWithErrors:
            break;
        case fusion::exec::RunStatus::SecurityViolation:
            lfc::reportFatal("SecurityViolation", "execution blocked at security level " +
                                                      std::string(fusion::security::toString(config.value().level)));
            break;
        case fusion::exec::RunStatus::Halted:
            lfc::reportFatal("ExecutionError", "run halted after " + std::to_string(result.blocks.size()) + " of " +
                                                   std::to_string(program.blocks.size()) + " blocks");
            break;
        case fusion::exec::RunStatus::Cancelled:
            lfc::reportFatal("Cancelled", "run cancelled");
            break;
    }
    return result.exitCode();
}
