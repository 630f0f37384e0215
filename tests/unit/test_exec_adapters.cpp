// File: tests/unit/test_exec_adapters.cpp
// Purpose: Check program synthesis, command plans, stub rendering and
//          compiler diagnostic rewriting for subprocess languages.
// Key invariants: Compiler line numbers are mapped back onto .lf lines using
//                 the first user line of the synthesised program.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/exec/LanguageAdapters.cpp, src/exec/SubprocessExecutor.cpp

#include "exec/LanguageAdapters.hpp"
#include "exec/SubprocessExecutor.hpp"
#include "frontends/lf/LanguageTag.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <string>

using namespace fusion;
using exec::LanguageTag;

namespace
{
size_t lineCount(const std::string &text, size_t upTo)
{
    size_t n = 1;
    for (size_t i = 0; i < upTo; ++i)
        n += text[i] == '\n';
    return n;
}
} // namespace

TEST(LanguageAdapters, EveryGuestLanguageHasAnAdapter)
{
    for (auto tag : frontends::lf::kAllLanguageTags)
    {
        auto adapter = exec::makeLanguageAdapter(tag);
        if (frontends::lf::isNative(tag))
        {
            EXPECT_EQ(adapter, nullptr);
            continue;
        }
        ASSERT_NE(adapter, nullptr);
        EXPECT_EQ(adapter->language(), tag);
        EXPECT_FALSE(adapter->requiredTools().empty());
        EXPECT_EQ(adapter->marshaller().language(), tag);
    }
}

TEST(LanguageAdapters, CppProgramWrapsDeclarationsAndCode)
{
    auto cpp = exec::makeLanguageAdapter(LanguageTag::Cpp);
    const auto s = cpp->synthesize("cout << n << endl;", {"long long n = 5LL;"});

    const auto decl = s.text.find("long long n = 5LL;");
    const auto code = s.text.find("cout << n << endl;");
    ASSERT_NE(decl, std::string::npos);
    ASSERT_NE(code, std::string::npos);
    EXPECT_LT(s.text.find("int main() {"), decl);
    EXPECT_LT(decl, code);
    EXPECT_EQ(lineCount(s.text, code), s.firstUserLine);
    EXPECT_TRUE(cpp->inlinePrintf());

    const auto plan = cpp->plan({{"compiler", "/usr/bin/g++"}}, std::filesystem::path("/tmp/x"));
    ASSERT_EQ(plan.compile.size(), 1u);
    EXPECT_EQ(plan.compile[0].front(), "/usr/bin/g++");
    EXPECT_EQ(plan.run, std::vector<std::string>{"/tmp/x/main"});
}

TEST(LanguageAdapters, JavaCompilesThenRunsMainClass)
{
    auto java = exec::makeLanguageAdapter(LanguageTag::Java);
    EXPECT_EQ(java->sourceFileName(), "Main.java");
    const auto s = java->synthesize("System.out.println(1);", {});
    EXPECT_NE(s.text.find("public class Main"), std::string::npos);
    EXPECT_FALSE(java->inlinePrintf());

    const auto plan = java->plan({{"javac", "/bin/javac"}, {"java", "/bin/java"}}, std::filesystem::path("/tmp/j"));
    ASSERT_EQ(plan.compile.size(), 1u);
    EXPECT_EQ(plan.compile[0].front(), "/bin/javac");
    ASSERT_FALSE(plan.run.empty());
    EXPECT_EQ(plan.run.front(), "/bin/java");
    EXPECT_EQ(plan.run.back(), "Main");
}

TEST(LanguageAdapters, PhpDropsLeadingOpenTag)
{
    auto php = exec::makeLanguageAdapter(LanguageTag::Php);
    const auto s = php->synthesize("<?php echo 1;", {"$x = 1;"});
    EXPECT_EQ(s.text.find("<?php"), 0u);
    EXPECT_EQ(s.text.find("<?php", 1), std::string::npos);
    EXPECT_NE(s.text.find("echo 1;"), std::string::npos);
}

TEST(LanguageAdapters, InterpretedLanguagesHaveNoCompileStep)
{
    auto js = exec::makeLanguageAdapter(LanguageTag::Js);
    const auto plan = js->plan({{"node", "/usr/bin/node"}}, std::filesystem::path("/tmp/n"));
    EXPECT_TRUE(plan.compile.empty());
    ASSERT_EQ(plan.run.size(), 2u);
    EXPECT_EQ(plan.run[0], "/usr/bin/node");
}

TEST(SubprocessExecutor, StubShowsToolAndCode)
{
    EXPECT_EQ(exec::renderStub(LanguageTag::Rust, 4, "rustc", "println!(\"hi\");"),
              "[rust stub, line 4: rustc not found]\nprintln!(\"hi\");\n");
}

TEST(SubprocessExecutor, CompileErrorsMapToSourceLines)
{
    const std::string diag = "/tmp/fusion-1/main.cpp: In function 'int main()':\n"
                             "/tmp/fusion-1/main.cpp:14:5: error: 'y' was not declared in this scope\n"
                             "   14 |     y;\n"
                             "      |     ^\n";
    EXPECT_EQ(exec::summarizeCompileErrors(diag, "main.cpp", 7, 12),
              "line 9: error: 'y' was not declared in this scope\n");
}

TEST(SubprocessExecutor, CompileSummaryKeepsAtMostFiveLines)
{
    std::string diag;
    for (int i = 0; i < 8; ++i)
        diag += "main.rs:" + std::to_string(3 + i) + ": error: bad\n";
    const auto summary = exec::summarizeCompileErrors(diag, "main.rs", 1, 3);
    size_t lines = 0;
    for (char c : summary)
        lines += c == '\n';
    EXPECT_EQ(lines, 5u);
    EXPECT_EQ(summary.rfind("line 1: error: bad\n", 0), 0u);
}
