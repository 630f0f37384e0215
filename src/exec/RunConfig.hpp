//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/RunConfig.hpp
// Purpose: Run configuration for the scanner and dispatcher, loaded from an
//          optional fusion.config manifest and overridden by flags.
// Key invariants: A default-constructed RunConfig is valid; every timeout
//                 and budget is strictly positive after a successful load.
// Ownership/Lifetime: Caller owns the returned RunConfig.
// Links: docs/configuration.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "security/Rules.hpp"
#include "security/Severity.hpp"
#include "support/diag_expected.hpp"

#include <chrono>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fusion::exec
{

/// @brief Default manifest file name looked up next to the source.
inline constexpr const char *kRunConfigFileName = "fusion.config";

/// @brief What happens to a block whose toolchain is missing.
enum class FallbackPolicy
{
    Stub, ///< Render the block as text and continue.
    Fail, ///< Halt the run.
};

/// @brief Parsed manifest plus command-line overrides.
struct RunConfig
{
    /// @brief Scanner strictness.
    security::SecurityLevel level{security::SecurityLevel::Medium};

    /// @brief Wall-clock limit for one subprocess run step.
    std::chrono::milliseconds blockTimeout{10000};

    /// @brief Wall-clock limit for one compile step.
    std::chrono::milliseconds compileTimeout{60000};

    /// @brief Wall-clock limit for one native block.
    std::chrono::milliseconds nativeTimeout{10000};

    /// @brief Statements a native block may execute.
    uint64_t nativeStepBudget{10'000'000};

    FallbackPolicy fallback{FallbackPolicy::Stub};

    /// @brief Tool name to executable path, e.g. "g++" -> "/opt/gcc/bin/g++".
    std::map<std::string, std::string> toolchains;

    /// @brief Rule id to new severity; nullopt disables the rule.
    std::vector<std::pair<std::string, std::optional<security::Severity>>> ruleOverrides;

    /// @brief Emit [trace] records on stderr.
    bool trace{false};
};

/// @brief Parse manifest text; @p path is used in error messages only.
support::Expected<RunConfig> parseRunConfig(std::istream &in, const std::string &path);

/// @brief Read and parse the manifest at @p path.
support::Expected<RunConfig> loadRunConfig(const std::string &path);

/// @brief Built-in rules with the configured overrides applied.
support::Expected<security::RuleSet> buildRuleSet(const RunConfig &config);

} // namespace fusion::exec
