//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `lfc compile`: parse a fusion source and write its `.lsf`
// artifact.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "fusion/api/Fusion.hpp"
#include "tools/common/source_loader.hpp"

#include <filesystem>
#include <iostream>

/// @brief Handle `lfc compile <file.lf> [-o <file.lsf>]`.
/// @return 0 when the artifact was written, 1 on compile or I/O errors and 2
///         on usage errors.
int cmdCompile(int argc, char **argv)
{
    lfc::SharedCliOptions shared;
    std::string input;
    std::string output;
    for (int i = 0; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "-o")
        {
            if (i + 1 >= argc)
            {
                lfc::usage();
                return 2;
            }
            output = argv[++i];
            continue;
        }
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
        if (!input.empty() || (arg.size() > 1 && arg.front() == '-'))
        {
            lfc::usage();
            return 2;
        }
        input = arg;
    }
    if (input.empty())
    {
        lfc::usage();
        return 2;
    }
    if (output.empty())
        output = std::filesystem::path(input).replace_extension(".lsf").string();

    auto config = lfc::resolveConfig(shared, input);
    if (!config)
    {
        fusion::support::printDiag(config.error(), std::cerr);
        return 1;
    }

    fusion::api::Engine engine(config.value());
    auto compiled = engine.compileFile(input);
    compiled.diagnostics.printAll(std::cerr, &engine.sources());
    if (!compiled.succeeded())
        return 1;

    const auto &artifact = *compiled.artifact;
    auto written = fusion::tools::common::writeTextFile(output, fusion::frontends::lf::encodeArtifact(artifact));
    if (!written)
    {
        fusion::support::printDiag(written.error(), std::cerr);
        return 1;
    }
    std::cout << "compiled " << input << " -> " << output << " (" << artifact.program.blocks.size()
              << " blocks, hash " << artifact.program.sourceHash.substr(0, 16) << ")\n";
    return 0;
}
