//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/LanguageAdapters.hpp
// Purpose: Per-language knowledge of the subprocess executors: which tools
//          a block needs, how the full program is synthesised and which
//          commands build and run it.
// Key invariants: The synthesised program contains the user code verbatim
//                 and starts it on Synthesized::firstUserLine.
// Ownership/Lifetime: Adapters are immutable once constructed.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "exec/Marshal.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fusion::exec
{

/// @brief A tool role and the executable names that can fill it, in order
///        of preference.
struct ToolRequirement
{
    std::string role;
    std::vector<std::string> candidates;
};

/// @brief Source text written to the scratch directory.
struct Synthesized
{
    std::string text;
    uint32_t firstUserLine = 1; ///< 1-based line of the first user code line.
};

/// @brief Commands run inside the scratch directory.
struct CommandPlan
{
    std::vector<std::vector<std::string>> compile;
    std::vector<std::string> run;
};

class LanguageAdapter
{
  public:
    explicit LanguageAdapter(std::unique_ptr<MarshalAdapter> marshaller) : marshaller_(std::move(marshaller)) {}

    virtual ~LanguageAdapter() = default;

    virtual LanguageTag language() const = 0;

    virtual std::vector<ToolRequirement> requiredTools() const = 0;

    /// @brief Whether a lone rewritten printf may be printed in-process.
    virtual bool inlinePrintf() const
    {
        return false;
    }

    /// @brief File name of the synthesised source inside the scratch dir.
    virtual std::string sourceFileName() const = 0;

    virtual Synthesized synthesize(std::string_view code, const std::vector<std::string> &declarations) const = 0;

    /// @param tools Role to resolved executable path.
    virtual CommandPlan plan(const std::map<std::string, std::string> &tools,
                             const std::filesystem::path &dir) const = 0;

    const MarshalAdapter &marshaller() const
    {
        return *marshaller_;
    }

  private:
    std::unique_ptr<MarshalAdapter> marshaller_;
};

/// @brief Adapter for a subprocess language, null for the native one.
std::unique_ptr<LanguageAdapter> makeLanguageAdapter(LanguageTag language);

} // namespace fusion::exec
