//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/fusion/api/Fusion.hpp
// Purpose: Public facade over the three Fusion services: compile a fusion
//          source (or load a compiled artifact), scan it, and run it.
// Key invariants: run() never executes a program whose report is blocked.
//                 Programs compiled from identical normalised sources share
//                 one cached Program.
// Ownership/Lifetime: An Engine owns its source manager and artifact cache;
//                     programs handed to scan()/run() are borrowed.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/Cancellation.hpp"
#include "exec/Dispatcher.hpp"
#include "exec/RunConfig.hpp"
#include "frontends/lf/Artifact.hpp"
#include "frontends/lf/ArtifactCache.hpp"
#include "security/SecurityReport.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace fusion::api
{

/// @brief Library version reported by `lfc version`.
inline constexpr std::string_view kVersion = "1.0.0";

/// @brief Result of compiling or loading one program.
struct CompileOutput
{
    support::DiagnosticEngine diagnostics;
    std::optional<frontends::lf::Artifact> artifact;
    uint32_t fileId = 0;
    bool fromCache = false; ///< Program reused from the artifact cache.

    [[nodiscard]] bool succeeded() const
    {
        return artifact.has_value() && diagnostics.errorCount() == 0;
    }
};

/// @brief Per-run knobs that are not part of the persistent configuration.
struct RunOptions
{
    const common::CancelToken *cancel = nullptr;
    std::ostream *out = nullptr;      ///< Streams block stdout; optional.
    std::ostream *err = nullptr;      ///< Streams block stderr; optional.
    std::ostream *traceOut = nullptr; ///< Trace destination; null selects stderr.
    uint32_t fileId = 0;
};

class Engine
{
  public:
    explicit Engine(exec::RunConfig config = {});

    const exec::RunConfig &config() const
    {
        return config_;
    }

    /// @brief Compile fusion source text; @p path is used for diagnostics
    ///        and artifact metadata.
    CompileOutput compile(std::string_view source, const std::string &path = "<input>");

    /// @brief Compile the fusion source at @p path.
    CompileOutput compileFile(const std::string &path);

    /// @brief Load a program from a `.lsf` artifact or compile a source file.
    /// @param verifySource Also check the artifact against its source file
    ///        when that file still exists.
    CompileOutput load(const std::string &path, bool verifySource = true);

    /// @brief Scan @p program with the configured level and rule overrides.
    /// @return ConfigError diagnostic when an override names an unknown rule.
    support::Expected<security::SecurityReport> scan(const frontends::lf::Program &program) const;

    /// @brief Execute @p program, gated by @p report.
    exec::ExecutionResult run(const frontends::lf::Program &program,
                              const security::SecurityReport &report,
                              const RunOptions &options = {});

    support::SourceManager &sources()
    {
        return sources_;
    }

    size_t cachedPrograms() const
    {
        return cache_.size();
    }

  private:
    frontends::lf::ArtifactMetadata metadataFor(const std::string &path) const;

    exec::RunConfig config_;
    support::SourceManager sources_;
    frontends::lf::ArtifactCache cache_;
};

} // namespace fusion::api
