//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the top-level `lfc` driver. The executable dispatches to the
// compile, run and analyze subcommands; the remaining commands of the fusion
// tool family are owned by external tooling.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point and version banner for the `lfc` driver.

#include "cli.hpp"

#include "frontends/lf/Artifact.hpp"
#include "frontends/lf/LanguageTag.hpp"
#include "fusion/api/Fusion.hpp"

#include <iostream>
#include <string>

namespace
{

void printVersion()
{
    std::cout << "lfc v" << fusion::api::kVersion << "\n";
    std::cout << "artifact format: " << fusion::frontends::lf::kArtifactFormatVersion << "\n";
    std::cout << "languages:";
    for (auto tag : fusion::frontends::lf::kAllLanguageTags)
        std::cout << " " << fusion::frontends::lf::toString(tag);
    std::cout << "\n";
}

bool isExternalCommand(const std::string &cmd)
{
    return cmd == "package-exe" || cmd == "package-dll" || cmd == "benchmark" || cmd == "shell";
}

} // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        lfc::usage();
        return 2;
    }
    const std::string cmd = argv[1];
    if (cmd == "version" || cmd == "--version")
    {
        printVersion();
        return 0;
    }
    if (cmd == "compile")
        return cmdCompile(argc - 2, argv + 2);
    if (cmd == "run")
        return cmdRun(argc - 2, argv + 2);
    if (cmd == "analyze")
        return cmdAnalyze(argc - 2, argv + 2);
    if (isExternalCommand(cmd))
    {
        std::cerr << "lfc: '" << cmd << "' is provided by external tooling\n";
        return 2;
    }
    lfc::usage();
    return 2;
}
