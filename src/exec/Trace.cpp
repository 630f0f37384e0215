//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/Trace.cpp
// Purpose: Format dispatcher trace records.
// Key invariants: One record per line, flushed immediately so traces
//                 interleave correctly with guest output on a terminal.
// Ownership/Lifetime: See Trace.hpp.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#include "exec/Trace.hpp"

#include <iomanip>
#include <iostream>
#include <locale>

namespace fusion::exec
{

namespace
{

/// @brief Scoped classic-locale and fixed formatting on a stream.
class LocaleGuard
{
  public:
    explicit LocaleGuard(std::ostream &os) : os_(os), old_(os.imbue(std::locale::classic())), flags_(os.flags())
    {
    }

    ~LocaleGuard()
    {
        os_.flags(flags_);
        os_.imbue(old_);
    }

    LocaleGuard(const LocaleGuard &) = delete;
    LocaleGuard &operator=(const LocaleGuard &) = delete;

  private:
    std::ostream &os_;
    std::locale old_;
    std::ios::fmtflags flags_;
};

} // namespace

bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::stream() const
{
    return cfg.out ? *cfg.out : std::cerr;
}

void TraceSink::onBlockStart(size_t index, uint32_t line, frontends::lf::LanguageTag tag, std::string_view executor)
{
    if (!cfg.enabled())
        return;
    auto &os = stream();
    LocaleGuard lg(os);
    os << "[trace] block=" << index << " line=" << line << " lang=" << frontends::lf::toString(tag)
       << " executor=" << executor << '\n'
       << std::flush;
}

void TraceSink::onBlockEnd(size_t index, std::string_view status, double elapsedMs)
{
    if (!cfg.enabled())
        return;
    auto &os = stream();
    LocaleGuard lg(os);
    os << "[trace] block=" << index << " status=" << status << " ms=" << std::fixed << std::setprecision(3)
       << elapsedMs << '\n'
       << std::flush;
}

void TraceSink::onToolchain(std::string_view tool, const std::optional<std::string> &path)
{
    if (!cfg.enabled())
        return;
    auto &os = stream();
    os << "[trace] toolchain " << tool << " -> " << (path ? *path : std::string("<missing>")) << '\n' << std::flush;
}

void TraceSink::onRunEnd(std::string_view status, size_t blocksRun, double elapsedMs)
{
    if (!cfg.enabled())
        return;
    auto &os = stream();
    LocaleGuard lg(os);
    os << "[trace] run status=" << status << " blocks=" << blocksRun << " ms=" << std::fixed << std::setprecision(3)
       << elapsedMs << '\n'
       << std::flush;
}

void TraceSink::note(std::string_view message)
{
    if (!cfg.enabled())
        return;
    stream() << "[trace] " << message << '\n' << std::flush;
}

} // namespace fusion::exec
