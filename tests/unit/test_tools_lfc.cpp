// File: tests/unit/test_tools_lfc.cpp
// Purpose: Exercise lfc option parsing, configuration lookup and the
//          compile/run/analyze subcommands on temporary files.
// Key invariants: Command-line flags override values loaded from a config
//                 file; usage errors exit with status 2.
// Ownership/Lifetime: Each test owns a scratch directory removed on exit.
// Links: src/tools/lfc/cli.cpp, src/tools/lfc/cmd_compile.cpp,
//        src/tools/lfc/cmd_run.cpp, src/tools/lfc/cmd_analyze.cpp

#include "exec/Toolchain.hpp"
#include "tools/lfc/cli.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace
{
/// Mutable argv built from string literals.
class Args
{
  public:
    Args(std::initializer_list<std::string> args) : storage_(args)
    {
        for (auto &s : storage_)
            ptrs_.push_back(s.data());
    }

    int argc() const
    {
        return static_cast<int>(ptrs_.size());
    }

    char **argv()
    {
        return ptrs_.data();
    }

  private:
    std::vector<std::string> storage_;
    std::vector<char *> ptrs_;
};

void writeFile(const std::filesystem::path &path, const std::string &text)
{
    std::ofstream out(path, std::ios::binary);
    out << text;
}
} // namespace

TEST(LfcCli, ParsesSharedFlags)
{
    Args args{"--level", "strict", "--timeout", "250", "--trace", "--config", "x.config", "file.lf"};
    lfc::SharedCliOptions opts;
    int i = 0;
    EXPECT_EQ(lfc::parseSharedOption(i, args.argc(), args.argv(), opts), lfc::SharedOptionParseResult::Parsed);
    EXPECT_EQ(i, 1);
    ++i;
    EXPECT_EQ(lfc::parseSharedOption(i, args.argc(), args.argv(), opts), lfc::SharedOptionParseResult::Parsed);
    ++i;
    EXPECT_EQ(lfc::parseSharedOption(i, args.argc(), args.argv(), opts), lfc::SharedOptionParseResult::Parsed);
    ++i;
    EXPECT_EQ(lfc::parseSharedOption(i, args.argc(), args.argv(), opts), lfc::SharedOptionParseResult::Parsed);
    ++i;
    EXPECT_EQ(lfc::parseSharedOption(i, args.argc(), args.argv(), opts),
              lfc::SharedOptionParseResult::NotMatched);

    EXPECT_EQ(opts.level, fusion::security::SecurityLevel::Strict);
    ASSERT_TRUE(opts.timeout.has_value());
    EXPECT_EQ(opts.timeout->count(), 250);
    EXPECT_TRUE(opts.trace);
    EXPECT_EQ(opts.configPath, std::optional<std::string>("x.config"));
}

TEST(LfcCli, RejectsMalformedFlagValues)
{
    lfc::SharedCliOptions opts;
    Args level{"--level", "extreme"};
    int i = 0;
    EXPECT_EQ(lfc::parseSharedOption(i, level.argc(), level.argv(), opts), lfc::SharedOptionParseResult::Error);

    Args timeout{"--timeout", "-5"};
    i = 0;
    EXPECT_EQ(lfc::parseSharedOption(i, timeout.argc(), timeout.argv(), opts), lfc::SharedOptionParseResult::Error);

    Args missing{"--config"};
    i = 0;
    EXPECT_EQ(lfc::parseSharedOption(i, missing.argc(), missing.argv(), opts), lfc::SharedOptionParseResult::Error);
}

TEST(LfcCli, ConfigBesideInputThenFlagOverrides)
{
    fusion::exec::ScratchDir dir("lfc-test");
    writeFile(dir.path() / "fusion.config", "level low\nblock-timeout 900\n");
    const auto input = (dir.path() / "prog.lf").string();

    lfc::SharedCliOptions opts;
    auto fromFile = lfc::resolveConfig(opts, input);
    ASSERT_TRUE(fromFile.hasValue());
    EXPECT_EQ(fromFile.value().level, fusion::security::SecurityLevel::Low);
    EXPECT_EQ(fromFile.value().blockTimeout.count(), 900);

    opts.level = fusion::security::SecurityLevel::High;
    opts.timeout = std::chrono::milliseconds(100);
    auto overridden = lfc::resolveConfig(opts, input);
    ASSERT_TRUE(overridden.hasValue());
    EXPECT_EQ(overridden.value().level, fusion::security::SecurityLevel::High);
    EXPECT_EQ(overridden.value().blockTimeout.count(), 100);
    EXPECT_EQ(overridden.value().nativeTimeout.count(), 100);

    opts.configPath = (dir.path() / "missing.config").string();
    EXPECT_FALSE(lfc::resolveConfig(opts, input).hasValue());
}

TEST(LfcCommands, CompileRunAndAnalyze)
{
    fusion::exec::ScratchDir dir("lfc-test");
    const auto source = dir.path() / "hello.lf";
    writeFile(source, "#name \"Hello\"\npy.greeting = 'hi'\npy.print(greeting)\n");

    Args compile{source.string()};
    EXPECT_EQ(cmdCompile(compile.argc(), compile.argv()), 0);
    const auto artifact = dir.path() / "hello.lsf";
    EXPECT_TRUE(std::filesystem::exists(artifact));

    Args run{artifact.string()};
    EXPECT_EQ(cmdRun(run.argc(), run.argv()), 0);

    Args analyze{source.string(), "--level", "strict"};
    EXPECT_EQ(cmdAnalyze(analyze.argc(), analyze.argv()), 0);
}

TEST(LfcCommands, FailuresMapToExitCodes)
{
    fusion::exec::ScratchDir dir("lfc-test");
    const auto bad = dir.path() / "bad.lf";
    writeFile(bad, "cobol.DISPLAY 'X'\n");
    Args compile{bad.string()};
    EXPECT_EQ(cmdCompile(compile.argc(), compile.argv()), 1);

    const auto blocked = dir.path() / "blocked.lf";
    writeFile(blocked, "py.import os\npy.os.system('ls')\n");
    Args run{blocked.string()};
    EXPECT_EQ(cmdRun(run.argc(), run.argv()), 1);

    Args none{};
    EXPECT_EQ(cmdRun(none.argc(), none.argv()), 2);
    Args extra{"a.lf", "b.lf"};
    EXPECT_EQ(cmdCompile(extra.argc(), extra.argv()), 2);
}
