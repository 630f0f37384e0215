// File: tests/unit/test_lf_compiler.cpp
// Purpose: Exercise the .lf compiler, the LSF artifact codec and the
//          compile cache behind the public engine.
// Key invariants: The source hash ignores line endings and trailing
//                 whitespace; a decoded artifact whose blocks were edited
//                 fails its digest check.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/frontends/lf/Compiler.cpp, src/frontends/lf/Artifact.cpp,
//        src/api/Fusion.cpp

#include "frontends/lf/Artifact.hpp"
#include "frontends/lf/Compiler.hpp"
#include "fusion/api/Fusion.hpp"
#include "support/source_manager.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace fusion::frontends::lf;

namespace
{
constexpr const char *kSource = "#name \"Hello\"\n"
                                "#native_import \"math\"\n"
                                "py.message = \"Hi\"\n"
                                "py.print(message)\n"
                                "cpp.printf(\"%s\\n\", message);\n";

Program compileOrFail(const std::string &source)
{
    fusion::support::SourceManager sm;
    auto result = compile(CompilerInput{source, "hello.lf", std::nullopt}, sm);
    EXPECT_TRUE(result.succeeded());
    return result.program.value_or(Program{});
}
} // namespace

TEST(LfCompiler, BuildsProgramWithStats)
{
    const Program p = compileOrFail(kSource);
    ASSERT_EQ(p.blocks.size(), 3u);
    EXPECT_EQ(p.stats.totalLines, 5u);
    EXPECT_EQ(p.stats.directiveCount, 2u);
    EXPECT_EQ(p.stats.codeBlockCount, 3u);
    ASSERT_NE(p.firstDirective("name"), nullptr);
    EXPECT_EQ(p.firstDirective("name")->value, "Hello");
    ASSERT_EQ(p.nativeImports().size(), 1u);
    EXPECT_EQ(p.nativeImports()[0], "math");
    EXPECT_EQ(p.sourceHash.size(), 64u);
}

TEST(LfCompiler, HashIgnoresLineEndingsAndTrailingSpace)
{
    const std::string unix = "py.x = 1\npy.print(x)\n";
    const std::string dos = "py.x = 1  \r\npy.print(x)\t\r\n\r\n";
    EXPECT_EQ(computeSourceHash(unix), computeSourceHash(dos));
    EXPECT_NE(computeSourceHash(unix), computeSourceHash("py.x = 2\npy.print(x)\n"));
    EXPECT_EQ(normalizeSource(dos), "py.x = 1\npy.print(x)");
}

TEST(LfCompiler, ErrorsLeaveNoProgram)
{
    fusion::support::SourceManager sm;
    auto result = compile(CompilerInput{"py.x = 1\nrust\n", "bad.lf", std::nullopt}, sm);
    EXPECT_FALSE(result.succeeded());
    EXPECT_FALSE(result.program.has_value());
    EXPECT_EQ(result.diagnostics.errorCount(), 1u);
    EXPECT_EQ(sm.getPath(result.fileId), "bad.lf");
}

TEST(LfArtifact, EncodeDecodePreservesProgram)
{
    Artifact artifact;
    artifact.program = compileOrFail(kSource);
    artifact.metadata.sourceFile = "hello.lf";
    artifact.metadata.compileTime = currentTimestamp();

    const std::string text = encodeArtifact(artifact);
    EXPECT_NE(text.find("\"format_version\": \"LSF-3.0\""), std::string::npos);
    EXPECT_NE(text.find("\"compiler_id\": "), std::string::npos);

    auto decoded = decodeArtifact(text);
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_EQ(decoded.value().formatVersion, kArtifactFormatVersion);
    EXPECT_EQ(decoded.value().metadata.sourceFile, "hello.lf");
    EXPECT_TRUE(decoded.value().program == artifact.program);
    EXPECT_TRUE(verifySourceHash(decoded.value(), kSource).hasValue());
    EXPECT_FALSE(verifySourceHash(decoded.value(), "py.print(2)\n").hasValue());
}

TEST(LfArtifact, LegacyArtifactWithoutFragmentsLoads)
{
    const std::string legacy = R"json({
  "format_version": "LSF-3.0",
  "metadata": {"compiler": "lf-compiler-optimized-v3", "source_file": "old.lf"},
  "program": {
    "directives": [{"line": 1, "type": "name", "value": "Old"}],
    "code_blocks": [{"line": 2, "type": "py", "content": "x = 1\nprint(x)"}],
    "source_hash": "0123456789abcdef"
  }
})json";
    auto decoded = decodeArtifact(legacy);
    ASSERT_TRUE(decoded.hasValue());
    const Artifact &a = decoded.value();
    EXPECT_EQ(a.metadata.compilerId, "lf-compiler-optimized-v3");
    ASSERT_EQ(a.program.blocks.size(), 1u);
    ASSERT_EQ(a.program.blocks[0].fragments.size(), 2u);
    EXPECT_EQ(a.program.blocks[0].fragments[1].line, 3u);
    ASSERT_NE(a.program.firstDirective("name"), nullptr);
    EXPECT_EQ(a.program.firstDirective("name")->value, "Old");
}

TEST(LfArtifact, EditedBlockFailsDigest)
{
    Artifact artifact;
    artifact.program = compileOrFail(kSource);
    std::string text = encodeArtifact(artifact);

    const auto at = text.find("print(message)");
    ASSERT_NE(at, std::string::npos);
    text.replace(at, 5, "input");

    auto decoded = decodeArtifact(text);
    ASSERT_FALSE(decoded.hasValue());
    EXPECT_EQ(decoded.error().code, "IntegrityError");
}

TEST(LfArtifact, RejectsNonArtifactText)
{
    auto decoded = decodeArtifact("[1, 2, 3]");
    ASSERT_FALSE(decoded.hasValue());
    EXPECT_EQ(decoded.error().code, "IntegrityError");
}

TEST(FusionEngine, CompileReusesCachedProgram)
{
    fusion::api::Engine engine{fusion::exec::RunConfig{}};

    auto first = engine.compile(kSource, "hello.lf");
    ASSERT_TRUE(first.succeeded());
    EXPECT_FALSE(first.fromCache);

    // Same text after normalization hits the cache.
    std::string dos = kSource;
    for (size_t pos = 0; (pos = dos.find('\n', pos)) != std::string::npos; pos += 2)
        dos.insert(pos, "\r");
    auto second = engine.compile(dos, "hello.lf");
    ASSERT_TRUE(second.succeeded());
    EXPECT_TRUE(second.fromCache);
    EXPECT_EQ(engine.cachedPrograms(), 1u);
    EXPECT_EQ(second.artifact->program.sourceHash, first.artifact->program.sourceHash);
}
