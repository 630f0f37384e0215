//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/lfc/cli.hpp
// Purpose: Declarations for lfc subcommand handlers and shared option parsing.
// Key invariants: Handlers return 0 on success, 1 on fatal errors and 2 on
//                 usage errors.
// Ownership/Lifetime: N/A.
// Links: docs/lfc.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "exec/RunConfig.hpp"
#include "security/Severity.hpp"
#include "support/diag_expected.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace lfc
{

/// @brief Flags accepted by every subcommand that loads a program.
struct SharedCliOptions
{
    std::optional<fusion::security::SecurityLevel> level;
    std::optional<std::string> configPath;
    std::optional<std::chrono::milliseconds> timeout;
    bool trace = false;
};

/// @brief Result of attempting to parse a shared CLI option.
enum class SharedOptionParseResult
{
    NotMatched, ///< Argument does not correspond to a shared option.
    Parsed,     ///< Argument consumed and reflected in the configuration.
    Error       ///< Argument looked like a shared option but was malformed.
};

/// @brief Parse an lfc option common to multiple subcommands.
/// @param index Index of the current argument; advanced when a value is consumed.
SharedOptionParseResult parseSharedOption(int &index, int argc, char **argv, SharedCliOptions &opts);

/// @brief Configuration for a run over @p inputPath.
/// @details Loads `--config` when given, otherwise `fusion.config` beside the
///          input when present, then applies command-line overrides.
fusion::support::Expected<fusion::exec::RunConfig> resolveConfig(const SharedCliOptions &opts,
                                                                 const std::string &inputPath);

/// @brief Print `error[<category>]: <message>` to stderr.
void reportFatal(const std::string &category, const std::string &message);

void usage();

} // namespace lfc

int cmdCompile(int argc, char **argv);

int cmdRun(int argc, char **argv);

int cmdAnalyze(int argc, char **argv);
