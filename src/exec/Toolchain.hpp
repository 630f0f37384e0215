//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Toolchain.hpp
// Purpose: Locate guest-language compilers and interpreters, and provide the
//          scratch directory each subprocess block is built in.
// Key invariants: Configured overrides win over PATH; a lookup result is
//                 cached for the lifetime of the resolver.
// Ownership/Lifetime: One resolver per run; ScratchDir removes its tree on
//                     destruction.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace fusion::exec
{

class TraceSink;

/// @brief Resolves tool names ("g++", "node", ...) to executable paths.
class ToolchainResolver
{
  public:
    explicit ToolchainResolver(std::map<std::string, std::string> overrides = {}, TraceSink *trace = nullptr);

    /// @brief Absolute path of @p tool, or nullopt when it cannot be found.
    std::optional<std::string> resolve(const std::string &tool);

  private:
    std::optional<std::string> lookup(const std::string &tool) const;

    std::map<std::string, std::string> overrides_;
    std::map<std::string, std::optional<std::string>> cache_;
    TraceSink *trace_;
};

/// @brief Search the directories of @p pathVariable for an executable @p tool.
std::optional<std::string> findInPath(const std::string &tool, const std::string &pathVariable);

/// @brief Thrown when a scratch directory cannot be created.
class ScratchDirError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// @brief Private temporary directory removed on destruction.
class ScratchDir
{
  public:
    /// @throws ScratchDirError when the directory cannot be created.
    explicit ScratchDir(const std::string &prefix);
    ~ScratchDir();

    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    const std::filesystem::path &path() const noexcept
    {
        return path_;
    }

  private:
    std::filesystem::path path_;
};

} // namespace fusion::exec
