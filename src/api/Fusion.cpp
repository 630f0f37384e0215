//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/api/Fusion.cpp
// Purpose: Wire the frontend, scanner and dispatcher behind fusion::api.
// Key invariants: See header.
// Ownership/Lifetime: See header.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "fusion/api/Fusion.hpp"

#include "exec/Trace.hpp"
#include "frontends/lf/Compiler.hpp"
#include "security/Scanner.hpp"
#include "tools/common/source_loader.hpp"

#include <filesystem>
#include <system_error>

namespace fusion::api
{

namespace fs = std::filesystem;

Engine::Engine(exec::RunConfig config) : config_(std::move(config)) {}

frontends::lf::ArtifactMetadata Engine::metadataFor(const std::string &path) const
{
    frontends::lf::ArtifactMetadata meta;
    meta.sourceFile = fs::path(path).filename().string();
    std::error_code ec;
    const auto absolute = fs::absolute(path, ec);
    meta.sourcePath = ec ? path : absolute.string();
    meta.compileTime = frontends::lf::currentTimestamp();
    meta.securityLevel = std::string(security::toString(config_.level));
    return meta;
}

CompileOutput Engine::compile(std::string_view source, const std::string &path)
{
    CompileOutput out;
    out.fileId = sources_.addFile(path);

    const std::string hash = frontends::lf::computeSourceHash(source);
    if (auto cached = cache_.find(hash))
    {
        out.artifact = frontends::lf::Artifact{};
        out.artifact->metadata = metadataFor(path);
        out.artifact->program = *cached;
        out.fromCache = true;
        return out;
    }

    auto result = frontends::lf::compile(frontends::lf::CompilerInput{source, path, out.fileId}, sources_);
    out.diagnostics.append(result.diagnostics);
    if (!result.succeeded())
        return out;

    out.artifact = frontends::lf::Artifact{};
    out.artifact->metadata = metadataFor(path);
    out.artifact->program = *cache_.insert(std::move(*result.program));
    return out;
}

CompileOutput Engine::compileFile(const std::string &path)
{
    auto text = tools::common::loadSourceFile(path);
    if (!text)
    {
        CompileOutput out;
        out.fileId = sources_.addFile(path);
        out.diagnostics.report(text.error());
        return out;
    }
    return compile(text.value(), path);
}

CompileOutput Engine::load(const std::string &path, bool verifySource)
{
    if (fs::path(path).extension() != ".lsf")
        return compileFile(path);

    CompileOutput out;
    out.fileId = sources_.addFile(path);
    auto text = tools::common::loadSourceFile(path);
    if (!text)
    {
        out.diagnostics.report(text.error());
        return out;
    }

    auto artifact = frontends::lf::decodeArtifact(text.value());
    if (!artifact)
    {
        support::Diagnostic d = artifact.error();
        d.loc.file_id = out.fileId;
        out.diagnostics.report(std::move(d));
        return out;
    }

    const std::string &sourcePath = artifact.value().metadata.sourcePath;
    std::error_code ec;
    if (verifySource && !sourcePath.empty() && fs::is_regular_file(sourcePath, ec))
    {
        auto source = tools::common::loadSourceFile(sourcePath);
        if (!source)
        {
            out.diagnostics.report(source.error());
            return out;
        }
        auto verified = frontends::lf::verifySourceHash(artifact.value(), source.value());
        if (!verified)
        {
            support::Diagnostic d = verified.error();
            d.loc.file_id = out.fileId;
            out.diagnostics.report(std::move(d));
            return out;
        }
    }

    out.artifact = std::move(artifact.value());
    return out;
}

support::Expected<security::SecurityReport> Engine::scan(const frontends::lf::Program &program) const
{
    auto rules = exec::buildRuleSet(config_);
    if (!rules)
        return rules.error();
    const security::Scanner scanner(std::move(rules.value()));
    return scanner.scan(program, config_.level);
}

exec::ExecutionResult Engine::run(const frontends::lf::Program &program,
                                  const security::SecurityReport &report,
                                  const RunOptions &options)
{
    exec::TraceConfig traceConfig;
    traceConfig.mode = config_.trace ? exec::TraceConfig::Blocks : exec::TraceConfig::Off;
    traceConfig.out = options.traceOut;
    exec::TraceSink trace(traceConfig);
    exec::TraceSink *sink = trace.enabled() ? &trace : nullptr;

    auto registry = exec::ExecutorRegistry::standard(config_, sink);

    exec::DispatchOptions dispatch;
    dispatch.blockTimeout = config_.blockTimeout;
    dispatch.nativeTimeout = config_.nativeTimeout;
    dispatch.cancel = options.cancel;
    dispatch.out = options.out;
    dispatch.err = options.err;
    dispatch.trace = sink;
    dispatch.fileId = options.fileId;

    exec::Dispatcher dispatcher(*registry, dispatch);
    return dispatcher.run(program, report);
}

} // namespace fusion::api
