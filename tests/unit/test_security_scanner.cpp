// File: tests/unit/test_security_scanner.cpp
// Purpose: Check pattern rules, structural auditing of native blocks and
//          level-based gating of the security scanner.
// Key invariants: A program is blocked exactly when some finding reaches the
//                 threshold of the requested level; aliases carry across
//                 native blocks.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/security/Scanner.cpp, src/security/AstAudit.cpp,
//        src/security/Rules.cpp

#include "frontends/lf/Compiler.hpp"
#include "security/Scanner.hpp"
#include "support/source_manager.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <string>

using namespace fusion;
using security::SecurityLevel;
using security::Severity;

namespace
{
frontends::lf::Program compileOrFail(const std::string &source)
{
    support::SourceManager sm;
    auto result = frontends::lf::compile(frontends::lf::CompilerInput{source, "scan.lf", std::nullopt}, sm);
    EXPECT_TRUE(result.succeeded());
    return result.program.value_or(frontends::lf::Program{});
}

const security::SecurityFinding *findRule(const security::SecurityReport &report, const std::string &id)
{
    for (const auto &f : report.findings())
    {
        if (f.ruleId == id)
            return &f;
    }
    return nullptr;
}
} // namespace

TEST(SecurityLevels, ThresholdsTightenWithLevel)
{
    EXPECT_EQ(security::blockingThreshold(SecurityLevel::Low), Severity::Critical);
    EXPECT_EQ(security::blockingThreshold(SecurityLevel::Medium), Severity::High);
    EXPECT_EQ(security::blockingThreshold(SecurityLevel::High), Severity::Medium);
    EXPECT_EQ(security::blockingThreshold(SecurityLevel::Strict), Severity::Low);
    EXPECT_FALSE(security::parseSecurityLevel("paranoid").has_value());
}

TEST(SecurityScanner, LevelDecidesWhetherFindingBlocks)
{
    const auto program = compileOrFail("py.print('hi')\n"
                                       "js.const http = require('http');\n");

    const auto medium = security::scan(program, SecurityLevel::Medium);
    const auto *network = findRule(medium, "js.network");
    ASSERT_NE(network, nullptr);
    EXPECT_EQ(network->severity, Severity::Medium);
    EXPECT_EQ(network->line, 2u);
    ASSERT_TRUE(network->block.has_value());
    EXPECT_EQ(*network->block, 1u);
    EXPECT_FALSE(medium.blocked());

    const auto high = security::scan(program, SecurityLevel::High);
    EXPECT_TRUE(high.blocked());
    ASSERT_EQ(high.blocking().size(), 1u);
    EXPECT_EQ(high.blocking()[0]->ruleId, "js.network");
}

TEST(SecurityScanner, ProcessSpawnBlocksAtMediumButNotLow)
{
    const auto program = compileOrFail("cpp.system(\"ls\");\n");
    EXPECT_TRUE(security::scan(program, SecurityLevel::Medium).blocked());
    EXPECT_FALSE(security::scan(program, SecurityLevel::Low).blocked());
}

TEST(SecurityScanner, AliasesAreFollowedAcrossBlocks)
{
    const auto program = compileOrFail("py.import os as q\n"
                                       "py.runner = q\n"
                                       "py.runner.system('ls')\n");
    const auto report = security::scan(program, SecurityLevel::Medium);
    EXPECT_EQ(findRule(report, "py.os-exec"), nullptr);

    const auto *spawn = findRule(report, "py.ast.spawn");
    ASSERT_NE(spawn, nullptr);
    EXPECT_EQ(spawn->line, 3u);
    EXPECT_NE(findRule(report, "py.ast.import"), nullptr);
    EXPECT_TRUE(report.blocked());
}

TEST(SecurityScanner, FromImportAliasIsTracked)
{
    const auto program = compileOrFail("py.from subprocess import run as go\n"
                                       "py.go(['ls'])\n");
    const auto report = security::scan(program, SecurityLevel::Low);
    const auto *spawn = findRule(report, "py.ast.spawn");
    ASSERT_NE(spawn, nullptr);
    EXPECT_EQ(spawn->line, 2u);
}

TEST(SecurityScanner, TraceHooksAreNativeMemoryAccess)
{
    const auto program = compileOrFail("py.import sys\n"
                                       "py.sys.setprofile(None)\n");
    const auto report = security::scan(program, SecurityLevel::Medium);
    const auto *hook = findRule(report, "py.ast.native-memory");
    ASSERT_NE(hook, nullptr);
    EXPECT_EQ(hook->line, 2u);
    EXPECT_EQ(hook->severity, Severity::High);
}

TEST(SecurityScanner, UnparsableNativeBlockIsReported)
{
    const auto program = compileOrFail("py.x = = 1\n");
    const auto report = security::scan(program, SecurityLevel::Medium);
    const auto *parse = findRule(report, "py.parse-error");
    ASSERT_NE(parse, nullptr);
    EXPECT_EQ(parse->severity, Severity::Medium);
    EXPECT_FALSE(report.blocked());
    EXPECT_TRUE(security::scan(program, SecurityLevel::High).blocked());
}

TEST(SecurityScanner, RestrictedNativeImportDirective)
{
    const auto program = compileOrFail("#native_import \"os\"\npy.print(1)\n");
    const auto report = security::scan(program, SecurityLevel::Medium);
    const auto *directive = findRule(report, "directive.native-import");
    ASSERT_NE(directive, nullptr);
    EXPECT_FALSE(directive->block.has_value());
    EXPECT_EQ(directive->line, 1u);
    EXPECT_TRUE(report.blocked());
}

TEST(SecurityScanner, RuleOverridesChangeOutcome)
{
    const auto program = compileOrFail("js.const http = require('http');\n");

    auto raised = security::RuleSet::defaults();
    ASSERT_TRUE(raised.override("js.network", Severity::Critical));
    EXPECT_TRUE(security::Scanner(raised).scan(program, SecurityLevel::Low).blocked());

    auto disabled = security::RuleSet::defaults();
    ASSERT_TRUE(disabled.override("js.network", std::nullopt));
    EXPECT_TRUE(security::Scanner(disabled).scan(program, SecurityLevel::Strict).findings().empty());

    EXPECT_FALSE(disabled.override("no.such.rule", Severity::Low));
}

TEST(SecurityScanner, CleanProgramRendersSummary)
{
    const auto program = compileOrFail("py.print(sum([1, 2, 3]))\ncpp.int x = 1;\n");
    const auto report = security::scan(program, SecurityLevel::Strict);
    EXPECT_TRUE(report.findings().empty());
    EXPECT_FALSE(report.blocked());

    std::ostringstream os;
    report.render(os);
    EXPECT_FALSE(os.str().empty());
}
