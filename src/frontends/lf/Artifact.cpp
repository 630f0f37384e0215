//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lf/Artifact.cpp
// Purpose: JSON codec and integrity checks for compiled artifacts.
// Key invariants: See Artifact.hpp.
// Ownership/Lifetime: See Artifact.hpp.
// Links: docs/lf-format.md
//
//===----------------------------------------------------------------------===//

#include "frontends/lf/Artifact.hpp"

#include "frontends/lf/Compiler.hpp"
#include "frontends/lf/Tokenizer.hpp"

#include <cctype>
#include <ctime>

namespace fusion::frontends::lf
{
namespace
{
using support::json::Value;

support::Diag integrityError(std::string msg)
{
    return support::makeError("IntegrityError", {}, std::move(msg));
}

bool isHexDigest(const std::string &s)
{
    if (s.size() != 16 && s.size() != 64)
        return false;
    for (char c : s)
    {
        if (!std::isxdigit(static_cast<unsigned char>(c)) || std::isupper(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

const Value *member(const Value &obj, std::string_view key, Value::Kind kind)
{
    const Value *v = obj.find(key);
    if (!v)
        return nullptr;
    if (v->kind() == kind)
        return v;
    if (kind == Value::Kind::Float && v->isInt())
        return v;
    return nullptr;
}

std::string stringOr(const Value &obj, std::string_view key, std::string fallback = {})
{
    const Value *v = member(obj, key, Value::Kind::String);
    return v ? v->asString() : std::move(fallback);
}

support::Expected<std::vector<Directive>> decodeDirectives(const Value &program)
{
    std::vector<Directive> out;
    const Value *list = program.find("directives");
    if (!list)
        return out;
    if (!list->isArray())
        return integrityError("program.directives must be an array");

    for (const auto &entry : list->asArray())
    {
        const Value *line = member(entry, "line", Value::Kind::Int);
        const Value *value = member(entry, "value", Value::Kind::String);
        const Value *name = member(entry, "name", Value::Kind::String);
        if (!name)
            name = member(entry, "type", Value::Kind::String);
        if (!line || !value || !name)
            return integrityError("malformed directive entry in artifact");
        out.push_back(Directive{name->asString(), value->asString(),
                                static_cast<uint32_t>(line->asInt())});
    }
    return out;
}

support::Expected<std::vector<CodeBlock>> decodeBlocks(const Value &program)
{
    std::vector<CodeBlock> out;
    const Value *list = member(program, "code_blocks", Value::Kind::Array);
    if (!list)
        return integrityError("artifact has no program.code_blocks array");

    for (const auto &entry : list->asArray())
    {
        const Value *line = member(entry, "line", Value::Kind::Int);
        const Value *type = member(entry, "type", Value::Kind::String);
        const Value *content = member(entry, "content", Value::Kind::String);
        if (!line || !type || !content)
            return integrityError("malformed code block entry in artifact");

        auto tag = parseLanguageTag(type->asString());
        if (!tag)
            return integrityError("artifact names unknown language tag '" + type->asString() + "'");

        CodeBlock block;
        block.line = static_cast<uint32_t>(line->asInt());
        block.tag = *tag;
        block.content = content->asString();

        if (const Value *frags = member(entry, "fragments", Value::Kind::Array))
        {
            for (const auto &f : frags->asArray())
            {
                const Value *fl = member(f, "line", Value::Kind::Int);
                const Value *ft = member(f, "text", Value::Kind::String);
                if (!fl || !ft)
                    return integrityError("malformed fragment in artifact");
                block.fragments.push_back(
                    Fragment{static_cast<uint32_t>(fl->asInt()), ft->asString()});
            }
        }
        else
        {
            uint32_t n = block.line;
            for (auto text : splitLines(block.content))
                block.fragments.push_back(Fragment{n++, std::string(text)});
        }
        out.push_back(std::move(block));
    }
    return out;
}
} // namespace

std::string currentTimestamp()
{
    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

Value artifactToJson(const Artifact &artifact)
{
    const Program &p = artifact.program;

    Value metadata = Value::object();
    metadata.set("compiler_id", artifact.metadata.compilerId);
    metadata.set("source_file", artifact.metadata.sourceFile);
    metadata.set("source_path", artifact.metadata.sourcePath);
    metadata.set("compile_time", artifact.metadata.compileTime);
    metadata.set("security_level", artifact.metadata.securityLevel);
    metadata.set("optimization_level", artifact.metadata.optimizationLevel);

    Value directives = Value::array();
    for (const auto &d : p.directivesInOrder())
    {
        Value entry = Value::object();
        entry.set("line", static_cast<int64_t>(d.line));
        entry.set("name", d.name);
        entry.set("value", d.value);
        directives.push(std::move(entry));
    }

    Value blocks = Value::array();
    for (const auto &b : p.blocks)
    {
        Value entry = Value::object();
        entry.set("line", static_cast<int64_t>(b.line));
        entry.set("type", std::string(toString(b.tag)));
        entry.set("content", b.content);
        Value frags = Value::array();
        for (const auto &f : b.fragments)
        {
            Value fe = Value::object();
            fe.set("line", static_cast<int64_t>(f.line));
            fe.set("text", f.text);
            frags.push(std::move(fe));
        }
        entry.set("fragments", std::move(frags));
        blocks.push(std::move(entry));
    }

    Value stats = Value::object();
    stats.set("total_lines", static_cast<int64_t>(p.stats.totalLines));
    stats.set("directive_count", static_cast<int64_t>(p.stats.directiveCount));
    stats.set("code_block_count", static_cast<int64_t>(p.stats.codeBlockCount));

    Value program = Value::object();
    program.set("directives", std::move(directives));
    program.set("code_blocks", std::move(blocks));
    program.set("source_hash", p.sourceHash);
    program.set("block_digest", p.blockDigest());
    program.set("parse_time", p.parseTime);
    program.set("stats", std::move(stats));

    Value root = Value::object();
    root.set("format_version", artifact.formatVersion);
    root.set("metadata", std::move(metadata));
    root.set("program", std::move(program));
    return root;
}

std::string encodeArtifact(const Artifact &artifact)
{
    return support::json::write(artifactToJson(artifact));
}

support::Expected<Artifact> decodeArtifact(std::string_view text)
{
    auto parsed = support::json::parse(text);
    if (!parsed)
        return parsed.error();
    const Value &root = parsed.value();
    if (!root.isObject())
        return integrityError("artifact root must be an object");

    Artifact artifact;
    artifact.formatVersion = stringOr(root, "format_version");
    if (artifact.formatVersion.rfind("LSF-3.", 0) != 0)
        return integrityError("unsupported artifact format '" + artifact.formatVersion + "'");

    if (const Value *meta = member(root, "metadata", Value::Kind::Object))
    {
        ArtifactMetadata &m = artifact.metadata;
        // Artifacts from the original tool spell the field "compiler".
        m.compilerId = stringOr(*meta, "compiler_id", stringOr(*meta, "compiler", m.compilerId));
        m.sourceFile = stringOr(*meta, "source_file");
        m.sourcePath = stringOr(*meta, "source_path");
        m.compileTime = stringOr(*meta, "compile_time");
        m.securityLevel = stringOr(*meta, "security_level", m.securityLevel);
        if (const Value *opt = member(*meta, "optimization_level", Value::Kind::Int))
            m.optimizationLevel = static_cast<int>(opt->asInt());
    }

    const Value *program = member(root, "program", Value::Kind::Object);
    if (!program)
        return integrityError("artifact has no program section");

    Program &p = artifact.program;
    p.sourceHash = stringOr(*program, "source_hash");
    if (!isHexDigest(p.sourceHash))
        return integrityError("artifact source_hash is missing or malformed");

    auto directives = decodeDirectives(*program);
    if (!directives)
        return directives.error();
    for (auto &d : directives.value())
        p.directives[d.name].push_back(std::move(d));

    auto blocks = decodeBlocks(*program);
    if (!blocks)
        return blocks.error();
    p.blocks = std::move(blocks.value());

    if (const Value *digest = member(*program, "block_digest", Value::Kind::String))
    {
        if (digest->asString() != p.blockDigest())
            return integrityError("artifact code blocks do not match block_digest");
    }

    if (const Value *pt = member(*program, "parse_time", Value::Kind::Float))
        p.parseTime = pt->asFloat();

    if (const Value *stats = member(*program, "stats", Value::Kind::Object))
    {
        auto count = [&](std::string_view key, size_t fallback) {
            const Value *v = member(*stats, key, Value::Kind::Int);
            return v ? static_cast<size_t>(v->asInt()) : fallback;
        };
        p.stats.totalLines = count("total_lines", 0);
        p.stats.directiveCount = count("directive_count", directives.value().size());
        p.stats.codeBlockCount = count("code_block_count", p.blocks.size());
    }
    else
    {
        p.stats.directiveCount = directives.value().size();
        p.stats.codeBlockCount = p.blocks.size();
    }

    return artifact;
}

support::Expected<void> verifySourceHash(const Artifact &artifact, std::string_view source)
{
    const std::string full = computeSourceHash(source);
    const std::string &stored = artifact.program.sourceHash;
    if (stored == full || (stored.size() == 16 && full.compare(0, 16, stored) == 0))
        return {};
    return integrityError("source hash mismatch: artifact was compiled from a different source");
}

} // namespace fusion::frontends::lf
