//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements option parsing and configuration lookup shared by the lfc
// subcommands.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Shared command-line plumbing for the lfc driver.

#include "cli.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <system_error>

namespace lfc
{

SharedOptionParseResult parseSharedOption(int &index, int argc, char **argv, SharedCliOptions &opts)
{
    const std::string arg = argv[index];
    if (arg == "--trace")
    {
        opts.trace = true;
        return SharedOptionParseResult::Parsed;
    }
    if (arg == "--level")
    {
        if (index + 1 >= argc)
            return SharedOptionParseResult::Error;
        auto level = fusion::security::parseSecurityLevel(argv[++index]);
        if (!level)
            return SharedOptionParseResult::Error;
        opts.level = *level;
        return SharedOptionParseResult::Parsed;
    }
    if (arg == "--config")
    {
        if (index + 1 >= argc)
            return SharedOptionParseResult::Error;
        opts.configPath = argv[++index];
        return SharedOptionParseResult::Parsed;
    }
    if (arg == "--timeout")
    {
        if (index + 1 >= argc)
            return SharedOptionParseResult::Error;
        std::string_view value(argv[index + 1]);
        long long parsed = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec != std::errc() || ptr != value.data() + value.size() || parsed <= 0)
            return SharedOptionParseResult::Error;
        opts.timeout = std::chrono::milliseconds(parsed);
        ++index;
        return SharedOptionParseResult::Parsed;
    }
    return SharedOptionParseResult::NotMatched;
}

fusion::support::Expected<fusion::exec::RunConfig> resolveConfig(const SharedCliOptions &opts,
                                                                 const std::string &inputPath)
{
    namespace fs = std::filesystem;

    fusion::exec::RunConfig config;
    std::optional<std::string> path = opts.configPath;
    if (!path)
    {
        const fs::path beside = fs::path(inputPath).parent_path() / fusion::exec::kRunConfigFileName;
        std::error_code ec;
        if (fs::is_regular_file(beside, ec))
            path = beside.string();
    }
    if (path)
    {
        auto loaded = fusion::exec::loadRunConfig(*path);
        if (!loaded)
            return loaded.error();
        config = std::move(loaded.value());
    }

    if (opts.level)
        config.level = *opts.level;
    if (opts.timeout)
    {
        config.blockTimeout = *opts.timeout;
        config.nativeTimeout = *opts.timeout;
    }
    if (opts.trace)
        config.trace = true;
    return config;
}

void reportFatal(const std::string &category, const std::string &message)
{
    std::cerr << "error[" << category << "]: " << message << "\n";
}

void usage()
{
    std::cerr << "Usage: lfc compile <file.lf> [-o <file.lsf>] [shared flags]\n"
              << "       lfc run <file.lf|file.lsf> [shared flags]\n"
              << "       lfc analyze <file.lf|file.lsf> [shared flags]\n"
              << "       lfc version\n"
              << "\nShared flags:\n"
              << "  --level low|medium|high|strict   security level (default medium)\n"
              << "  --config <file>                  run configuration (default: fusion.config\n"
              << "                                   beside the input, when present)\n"
              << "  --timeout <ms>                   per-block time limit\n"
              << "  --trace                          emit [trace] records on stderr\n"
              << "\npackage-exe, package-dll, benchmark and shell are provided by external tooling.\n";
}

} // namespace lfc
