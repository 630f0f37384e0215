//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Toolchain.cpp
// Purpose: PATH search and scratch directory management for subprocess
//          executors.
// Key invariants: Only regular files with execute permission are accepted.
// Ownership/Lifetime: See header.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#include "exec/Toolchain.hpp"

#include "exec/Trace.hpp"

#include <chrono>
#include <cstdlib>
#include <random>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace fusion::exec
{

namespace
{

bool isExecutableFile(const fs::path &candidate)
{
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec) || ec)
        return false;
    return ::access(candidate.c_str(), X_OK) == 0;
}

} // namespace

std::optional<std::string> findInPath(const std::string &tool, const std::string &pathVariable)
{
    if (tool.empty())
        return std::nullopt;
    if (tool.find('/') != std::string::npos)
    {
        if (isExecutableFile(tool))
            return tool;
        return std::nullopt;
    }

    std::istringstream iss(pathVariable);
    std::string dir;
    while (std::getline(iss, dir, ':'))
    {
        if (dir.empty())
            continue;
        const fs::path candidate = fs::path(dir) / tool;
        if (isExecutableFile(candidate))
            return candidate.string();
    }
    return std::nullopt;
}

ToolchainResolver::ToolchainResolver(std::map<std::string, std::string> overrides, TraceSink *trace)
    : overrides_(std::move(overrides)), trace_(trace)
{
}

std::optional<std::string> ToolchainResolver::resolve(const std::string &tool)
{
    auto it = cache_.find(tool);
    if (it != cache_.end())
        return it->second;

    auto path = lookup(tool);
    if (trace_)
        trace_->onToolchain(tool, path);
    cache_.emplace(tool, path);
    return path;
}

std::optional<std::string> ToolchainResolver::lookup(const std::string &tool) const
{
    // An override that does not exist makes the tool unavailable rather than
    // falling back to PATH.
    auto it = overrides_.find(tool);
    if (it != overrides_.end())
    {
        if (isExecutableFile(it->second))
            return it->second;
        return std::nullopt;
    }
    const char *env = std::getenv("PATH");
    return findInPath(tool, env ? env : "/usr/local/bin:/usr/bin:/bin");
}

ScratchDir::ScratchDir(const std::string &prefix)
{
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                        std::chrono::high_resolution_clock::now().time_since_epoch())
                        .count();
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    std::error_code ec;
    const fs::path base = fs::temp_directory_path(ec);
    if (ec)
        throw ScratchDirError("no temporary directory: " + ec.message());

    std::ostringstream name;
    name << prefix << "_" << ::getpid() << "_" << ns << "_" << dist(gen);
    path_ = base / name.str();

    if (!fs::create_directory(path_, ec))
        throw ScratchDirError("cannot create " + path_.string() + ": " + (ec ? ec.message() : "already exists"));

    fs::permissions(path_, fs::perms::owner_all, ec);
    if (ec)
    {
        std::error_code ignored;
        fs::remove_all(path_, ignored);
        throw ScratchDirError("cannot restrict " + path_.string() + ": " + ec.message());
    }
}

ScratchDir::~ScratchDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

} // namespace fusion::exec
