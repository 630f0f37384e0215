// File: tests/unit/test_exec_run_config.cpp
// Purpose: Parse fusion.config files and turn rule overrides into rule sets.
// Key invariants: Unknown keys, duplicate keys and malformed values are
//                 ConfigErrors carrying the file and line.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/exec/RunConfig.cpp, src/exec/Toolchain.cpp

#include "exec/RunConfig.hpp"
#include "exec/Toolchain.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <optional>
#include <sstream>
#include <string>

using namespace fusion;

namespace
{
support::Expected<exec::RunConfig> parseText(const std::string &text)
{
    std::istringstream in(text);
    return exec::parseRunConfig(in, "fusion.config");
}
} // namespace

TEST(RunConfig, DefaultsAreUsable)
{
    const exec::RunConfig config;
    EXPECT_EQ(config.level, security::SecurityLevel::Medium);
    EXPECT_EQ(config.fallback, exec::FallbackPolicy::Stub);
    EXPECT_GT(config.blockTimeout.count(), 0);
    EXPECT_FALSE(config.trace);
}

TEST(RunConfig, ParsesEveryKey)
{
    auto parsed = parseText("# sandbox settings\n"
                            "level strict\n"
                            "block-timeout 500\n"
                            "compile-timeout 20000\n"
                            "native-timeout 750\n"
                            "native-steps 1000\n"
                            "fallback fail\n"
                            "toolchain g++ /opt/gcc/bin/g++\n"
                            "toolchain node /usr/local/bin/node\n"
                            "rule py.sys off\n"
                            "rule js.network critical\n"
                            "trace on\n");
    ASSERT_TRUE(parsed.hasValue()) << parsed.error().message;
    const auto &c = parsed.value();
    EXPECT_EQ(c.level, security::SecurityLevel::Strict);
    EXPECT_EQ(c.blockTimeout.count(), 500);
    EXPECT_EQ(c.compileTimeout.count(), 20000);
    EXPECT_EQ(c.nativeTimeout.count(), 750);
    EXPECT_EQ(c.nativeStepBudget, 1000u);
    EXPECT_EQ(c.fallback, exec::FallbackPolicy::Fail);
    EXPECT_EQ(c.toolchains.at("g++"), "/opt/gcc/bin/g++");
    EXPECT_EQ(c.toolchains.at("node"), "/usr/local/bin/node");
    ASSERT_EQ(c.ruleOverrides.size(), 2u);
    EXPECT_FALSE(c.ruleOverrides[0].second.has_value());
    EXPECT_EQ(c.ruleOverrides[1].second, security::Severity::Critical);
    EXPECT_TRUE(c.trace);
}

TEST(RunConfig, ErrorsNameFileAndLine)
{
    auto unknown = parseText("level low\ncolour blue\n");
    ASSERT_FALSE(unknown.hasValue());
    EXPECT_EQ(unknown.error().code, "ConfigError");
    EXPECT_NE(unknown.error().message.find("fusion.config:2"), std::string::npos);

    EXPECT_FALSE(parseText("level extreme\n").hasValue());
    EXPECT_FALSE(parseText("block-timeout 0\n").hasValue());
    EXPECT_FALSE(parseText("block-timeout ten\n").hasValue());
    EXPECT_FALSE(parseText("level low\nlevel high\n").hasValue());
    EXPECT_FALSE(parseText("toolchain g++\n").hasValue());
    EXPECT_FALSE(parseText("trace maybe\n").hasValue());
}

TEST(RunConfig, RuleOverridesBuildRuleSet)
{
    exec::RunConfig config;
    config.ruleOverrides.emplace_back("py.sys", std::nullopt);
    config.ruleOverrides.emplace_back("cpp.asm", security::Severity::Critical);
    auto rules = exec::buildRuleSet(config);
    ASSERT_TRUE(rules.hasValue());
    ASSERT_NE(rules.value().find("py.sys"), nullptr);
    EXPECT_FALSE(rules.value().find("py.sys")->enabled);
    EXPECT_EQ(rules.value().find("cpp.asm")->severity, security::Severity::Critical);

    config.ruleOverrides.emplace_back("no.such.rule", std::nullopt);
    auto bad = exec::buildRuleSet(config);
    ASSERT_FALSE(bad.hasValue());
    EXPECT_EQ(bad.error().code, "ConfigError");
}

TEST(RunConfig, MissingFileIsConfigError)
{
    auto loaded = exec::loadRunConfig("/nonexistent/fusion.config");
    ASSERT_FALSE(loaded.hasValue());
    EXPECT_EQ(loaded.error().code, "ConfigError");
}

#ifndef _WIN32
TEST(Toolchain, OverridesWinOverPath)
{
    const std::map<std::string, std::string> overrides = {{"sh", "/bin/sh"}, {"ghost", "/nonexistent/ghost"}};
    exec::ToolchainResolver resolver(overrides);
    EXPECT_EQ(resolver.resolve("sh"), std::optional<std::string>("/bin/sh"));
    EXPECT_FALSE(resolver.resolve("ghost").has_value());
    EXPECT_FALSE(exec::findInPath("definitely-not-a-fusion-tool", "/bin:/usr/bin").has_value());
    EXPECT_TRUE(exec::findInPath("sh", "/nonexistent:/bin").has_value());
}

TEST(Toolchain, ScratchDirIsRemoved)
{
    std::filesystem::path kept;
    {
        exec::ScratchDir dir("fusion-test");
        kept = dir.path();
        EXPECT_TRUE(std::filesystem::is_directory(kept));
    }
    EXPECT_FALSE(std::filesystem::exists(kept));
}
#endif
