//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `lfc analyze`: print the security report of a program without
// running it.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "fusion/api/Fusion.hpp"

#include <iostream>

/// @brief Handle `lfc analyze <file.lf|file.lsf>`.
/// @return 0 when the report was produced, whatever its verdict.
int cmdAnalyze(int argc, char **argv)
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

    auto report = engine.scan(loaded.artifact->program);
    if (!report)
    {
        fusion::support::printDiag(report.error(), std::cerr);
        return 1;
    }
    report.value().render(std::cout);
    return 0;
}
