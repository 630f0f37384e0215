//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/Compiler.cpp
// Purpose: Wires the fusion front end phases together.
// Key invariants: See Compiler.hpp.
// Ownership/Lifetime: See Compiler.hpp.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#include "frontends/lf/Compiler.hpp"

#include "frontends/lf/BlockAssembler.hpp"
#include "frontends/lf/Directives.hpp"
#include "frontends/lf/Tokenizer.hpp"
#include "support/sha256.hpp"
#include "tools/common/source_loader.hpp"

#include <chrono>

namespace fusion::frontends::lf
{

bool CompilerResult::succeeded() const
{
    return program.has_value() && diagnostics.errorCount() == 0;
}

std::string normalizeSource(std::string_view source)
{
    std::string out;
    out.reserve(source.size());
    for (auto line : splitLines(source))
    {
        while (!line.empty() && (line.back() == ' ' || line.back() == '\t'))
            line.remove_suffix(1);
        out.append(line);
        out.push_back('\n');
    }
    while (!out.empty() && out.back() == '\n')
        out.pop_back();
    return out;
}

std::string computeSourceHash(std::string_view source)
{
    return support::sha256Hex(normalizeSource(source));
}

CompilerResult compile(const CompilerInput &input, support::SourceManager &sm)
{
    const auto start = std::chrono::steady_clock::now();

    CompilerResult result;
    result.fileId = input.fileId ? *input.fileId : sm.addFile(std::string(input.path));

    auto lines = tokenize(input.source, result.fileId);
    if (!lines)
    {
        result.diagnostics.report(lines.error());
        return result;
    }

    DirectiveProcessor directives(result.diagnostics, result.fileId);
    for (const auto &line : lines.value())
    {
        if (line.kind != LineKind::Directive)
            continue;
        if (auto ok = directives.add(line); !ok)
        {
            result.diagnostics.report(ok.error());
            return result;
        }
    }

    Program program;
    program.stats.totalLines = lines.value().size();
    program.stats.directiveCount = directives.count();
    program.directives = directives.take();
    program.blocks = assembleBlocks(lines.value());
    program.stats.codeBlockCount = program.blocks.size();
    program.sourceHash = computeSourceHash(input.source);
    program.parseTime =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    result.program = std::move(program);
    return result;
}

CompilerResult compileFile(const std::string &path, support::SourceManager &sm)
{
    const uint32_t fileId = sm.addFile(path);
    auto text = tools::common::loadSourceFile(path);
    if (!text)
    {
        CompilerResult result;
        result.fileId = fileId;
        result.diagnostics.report(text.error());
        return result;
    }
    return compile(CompilerInput{text.value(), path, fileId}, sm);
}

} // namespace fusion::frontends::lf
