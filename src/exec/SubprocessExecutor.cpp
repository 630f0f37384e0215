//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: exec/SubprocessExecutor.cpp
// Purpose: Build-and-run pipeline for subprocess languages.
// Key invariants: A missing toolchain is never reported as an execution
//                 error: it yields Stub or Unavailable depending on policy.
// Ownership/Lifetime: See header.
// Links: docs/dev/exec.md
//
//===----------------------------------------------------------------------===//

#include "exec/SubprocessExecutor.hpp"

#include "common/RunProcess.hpp"

#include <fstream>
#include <regex>
#include <sstream>

namespace fusion::exec
{

namespace
{

constexpr size_t kMaxErrorLines = 5;

std::string rewriteFileReferences(const std::string &text,
                                  const std::string &fileName,
                                  uint32_t blockLine,
                                  uint32_t firstUserLine)
{
    std::string escaped;
    for (char c : fileName)
    {
        if (c == '.')
            escaped += "\\.";
        else
            escaped.push_back(c);
    }
    const std::regex ref("(?:[^\\s:]*/)?" + escaped + ":(\\d+)(?::\\d+)?");

    std::string out;
    auto begin = std::sregex_iterator(text.begin(), text.end(), ref);
    size_t last = 0;
    for (auto it = begin; it != std::sregex_iterator(); ++it)
    {
        const auto &m = *it;
        out.append(text, last, static_cast<size_t>(m.position(0)) - last);
        const long synthesized = std::stol(m[1].str());
        const long user = synthesized - static_cast<long>(firstUserLine);
        if (user >= 0)
            out += "line " + std::to_string(static_cast<long>(blockLine) + user);
        else
            out += "line " + std::to_string(blockLine);
        last = static_cast<size_t>(m.position(0) + m.length(0));
    }
    out.append(text, last, std::string::npos);
    return out;
}

bool isErrorLine(const std::string &line)
{
    return line.find("error") != std::string::npos || line.find("Error") != std::string::npos;
}

} // namespace

std::string renderStub(LanguageTag language, uint32_t line, const std::string &tool, const std::string &code)
{
    std::string out = "[" + std::string(frontends::lf::toString(language)) + " stub, line " +
                      std::to_string(line) + ": " + tool + " not found]\n";
    out += code;
    if (!code.empty() && code.back() != '\n')
        out.push_back('\n');
    return out;
}

std::string summarizeCompileErrors(const std::string &diagnostics,
                                   const std::string &fileName,
                                   uint32_t blockLine,
                                   uint32_t firstUserLine)
{
    const std::string text = rewriteFileReferences(diagnostics, fileName, blockLine, firstUserLine);

    std::vector<std::string> errors;
    std::vector<std::string> other;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);)
    {
        if (line.find_first_not_of(" \t") == std::string::npos)
            continue;
        if (isErrorLine(line))
        {
            if (errors.size() < kMaxErrorLines)
                errors.push_back(line);
        }
        else if (other.size() < kMaxErrorLines)
        {
            other.push_back(line);
        }
    }

    const auto &kept = errors.empty() ? other : errors;
    std::string out;
    for (const auto &line : kept)
        out += line + "\n";
    return out;
}

SubprocessExecutor::SubprocessExecutor(std::unique_ptr<LanguageAdapter> adapter,
                                       ToolchainResolver &resolver,
                                       SubprocessOptions options)
    : adapter_(std::move(adapter)), resolver_(resolver), options_(options)
{
}

std::string SubprocessExecutor::name() const
{
    return "subprocess:" + adapter_->requiredTools().front().candidates.front();
}

bool SubprocessExecutor::available()
{
    return resolveTools().has_value();
}

std::optional<std::map<std::string, std::string>> SubprocessExecutor::resolveTools()
{
    std::map<std::string, std::string> tools;
    for (const auto &req : adapter_->requiredTools())
    {
        for (const auto &candidate : req.candidates)
        {
            if (auto path = resolver_.resolve(candidate))
            {
                tools.emplace(req.role, *path);
                break;
            }
        }
        if (!tools.count(req.role))
            return std::nullopt;
    }
    return tools;
}

std::string SubprocessExecutor::missingTool()
{
    for (const auto &req : adapter_->requiredTools())
    {
        bool found = false;
        for (const auto &candidate : req.candidates)
            found = found || resolver_.resolve(candidate).has_value();
        if (!found)
            return req.candidates.front();
    }
    return adapter_->requiredTools().front().candidates.front();
}

ExecutionOutcome SubprocessExecutor::unavailable(const BlockRequest &request, const std::string &tool) const
{
    ExecutionOutcome outcome;
    outcome.category = "ToolchainUnavailable";
    if (options_.fallback == FallbackPolicy::Stub)
    {
        outcome.status = BlockStatus::Stub;
        outcome.out = renderStub(language(), request.line, tool, request.code);
        outcome.err = tool + " not found; block rendered as text";
    }
    else
    {
        outcome.status = BlockStatus::Unavailable;
        outcome.err = tool + " not found";
    }
    return outcome;
}

ExecutionOutcome SubprocessExecutor::execute(const BlockRequest &request, vm::Environment &environment)
{
    auto tools = resolveTools();
    if (!tools)
        return unavailable(request, missingTool());

    ExecutionOutcome outcome;
    std::vector<std::string> declarations;
    try
    {
        declarations = marshalEnvironment(adapter_->marshaller(), request.code, environment);
    }
    catch (const MarshalError &e)
    {
        outcome.status = BlockStatus::Error;
        outcome.category = "MarshalError";
        outcome.err = e.what();
        return outcome;
    }

    const Synthesized program = adapter_->synthesize(request.code, declarations);

    try
    {
        ScratchDir dir("fusion_" + std::string(frontends::lf::toString(language())));
        const auto sourcePath = dir.path() / adapter_->sourceFileName();
        {
            std::ofstream file(sourcePath, std::ios::binary);
            file << program.text;
            if (!file)
            {
                outcome.status = BlockStatus::Error;
                outcome.category = "ExecutionError";
                outcome.err = "cannot write " + sourcePath.string();
                return outcome;
            }
        }

        const CommandPlan plan = adapter_->plan(*tools, dir.path());

        common::RunOptions opts;
        opts.cwd = dir.path().string();
        opts.cancel = request.cancel;

        opts.timeout = options_.compileTimeout;
        for (const auto &step : plan.compile)
        {
            const common::RunResult rr = common::run_process(step, opts);
            if (rr.cancelled)
            {
                outcome.status = BlockStatus::Cancelled;
                return outcome;
            }
            if (rr.launch_failed)
                return unavailable(request, step.front());
            if (rr.timed_out)
            {
                outcome.status = BlockStatus::Timeout;
                outcome.category = "CompileError";
                outcome.err = "compilation timed out after " + std::to_string(options_.compileTimeout.count()) + " ms";
                return outcome;
            }
            if (rr.exit_code != 0)
            {
                outcome.status = BlockStatus::Error;
                outcome.category = "CompileError";
                outcome.err = summarizeCompileErrors(rr.err + rr.out, adapter_->sourceFileName(), request.line,
                                                     program.firstUserLine);
                return outcome;
            }
        }

        opts.timeout = request.timeout;
        const common::RunResult rr = common::run_process(plan.run, opts);
        outcome.out = rr.out;
        outcome.err = rewriteFileReferences(rr.err, adapter_->sourceFileName(), request.line, program.firstUserLine);
        if (rr.cancelled)
        {
            outcome.status = BlockStatus::Cancelled;
        }
        else if (rr.launch_failed)
        {
            return unavailable(request, plan.run.front());
        }
        else if (rr.timed_out)
        {
            outcome.status = BlockStatus::Timeout;
            outcome.category = "ExecutionError";
            outcome.err += "block timed out after " + std::to_string(request.timeout.count()) + " ms\n";
        }
        else if (rr.exit_code != 0)
        {
            outcome.status = BlockStatus::Error;
            outcome.category = "ExecutionError";
            outcome.err += "process exited with status " + std::to_string(rr.exit_code) + "\n";
        }
    }
    catch (const ScratchDirError &e)
    {
        outcome.status = BlockStatus::Error;
        outcome.category = "ExecutionError";
        outcome.err = e.what();
    }
    return outcome;
}

} // namespace fusion::exec
