//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Trace.hpp
// Purpose: Declare tracing configuration and sink for dispatcher events.
// Key invariants: Trace output is deterministic apart from elapsed times and
//                 line-oriented; every record starts with "[trace]".
// Ownership/Lifetime: Sink holds configuration by value and borrows the
//                     output stream.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lf/LanguageTag.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace fusion::exec
{

/// @brief Configuration for dispatcher tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,   ///< Tracing disabled
        Blocks ///< Trace block dispatch and toolchain resolution
    } mode{Off};

    /// @brief Destination; null selects std::cerr.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    bool enabled() const
    {
        return cfg.enabled();
    }

    /// @brief Record that block @p index is about to run on @p executor.
    void onBlockStart(size_t index, uint32_t line, frontends::lf::LanguageTag tag, std::string_view executor);

    /// @brief Record the status a block finished with.
    void onBlockEnd(size_t index, std::string_view status, double elapsedMs);

    /// @brief Record a toolchain lookup; @p path empty when not found.
    void onToolchain(std::string_view tool, const std::optional<std::string> &path);

    /// @brief Record the final status of a run.
    void onRunEnd(std::string_view status, size_t blocksRun, double elapsedMs);

    /// @brief Free-form record.
    void note(std::string_view message);

  private:
    std::ostream &stream() const;

    TraceConfig cfg; ///< Active configuration
};

} // namespace fusion::exec
