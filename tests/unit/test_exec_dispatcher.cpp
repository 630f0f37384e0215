// File: tests/unit/test_exec_dispatcher.cpp
// Purpose: Drive whole programs through the dispatcher: ordering, shared
//          state, printf inlining, stub fallback, security gating and the
//          halt/continue rules for failing blocks.
// Key invariants: Blocks run strictly in source order; a native failure halts
//                 the run while a subprocess failure only marks it.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/exec/Dispatcher.cpp, src/exec/Registry.cpp, src/api/Fusion.cpp

#include "exec/Dispatcher.hpp"
#include "exec/Registry.hpp"
#include "fusion/api/Fusion.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

using namespace fusion;
using exec::BlockStatus;
using exec::RunStatus;

namespace
{
/// Overrides every subprocess toolchain with a path that does not exist.
exec::RunConfig withoutToolchains()
{
    exec::RunConfig config;
    for (const char *tool : {"g++", "c++", "clang++", "node", "nodejs", "javac", "java", "php", "rustc"})
        config.toolchains[tool] = std::string("/nonexistent/") + tool;
    return config;
}

struct Run
{
    api::CompileOutput compiled;
    exec::ExecutionResult result;
};

Run compileAndRun(api::Engine &engine, const std::string &source, const api::RunOptions &options = {})
{
    Run run;
    run.compiled = engine.compile(source, "test.lf");
    EXPECT_TRUE(run.compiled.succeeded());
    if (!run.compiled.succeeded())
        return run;
    auto report = engine.scan(run.compiled.artifact->program);
    EXPECT_TRUE(report.hasValue());
    if (!report)
        return run;
    run.result = engine.run(run.compiled.artifact->program, report.value(), options);
    return run;
}

/// Guest executor that fails every block with a fixed category.
class FailingExecutor final : public exec::LanguageExecutor
{
  public:
    exec::LanguageTag language() const override
    {
        return exec::LanguageTag::Js;
    }

    exec::ExecutorKind kind() const override
    {
        return exec::ExecutorKind::Subprocess;
    }

    std::string name() const override
    {
        return "failing";
    }

    bool available() override
    {
        return true;
    }

    exec::ExecutionOutcome execute(const exec::BlockRequest &, vm::Environment &) override
    {
        exec::ExecutionOutcome outcome;
        outcome.status = BlockStatus::Error;
        outcome.category = "ExecutionError";
        outcome.err = "boom\n";
        return outcome;
    }
};
} // namespace

TEST(Dispatcher, NativeBlocksShareStateInOrder)
{
    api::Engine engine{withoutToolchains()};
    auto run = compileAndRun(engine,
                             "py.x = 1\n"
                             "py.print(x)\n"
                             "py.def f(a):\n"
                             "py.    return a * 2\n"
                             "py.x = f(x + 1)\n"
                             "py.print(x)\n");
    EXPECT_EQ(run.result.status, RunStatus::Completed);
    EXPECT_EQ(run.result.output, "1\n4\n");
    ASSERT_EQ(run.result.blocks.size(), 5u);
    EXPECT_EQ(run.result.blocks[2].line, 3u);
    EXPECT_EQ(run.result.perLanguage[exec::LanguageTag::Py], 5u);
    ASSERT_EQ(run.result.variables.count("x"), 1u);
    EXPECT_EQ(run.result.variables.at("x").asInt(), 4);
    EXPECT_EQ(run.result.exitCode(), 0);
}

TEST(Dispatcher, CodeTrailingBlockCommentRuns)
{
    api::Engine engine{withoutToolchains()};
    auto run = compileAndRun(engine, "/*\nx\n*/ py.y = 5\npy.print(y)\n");
    EXPECT_EQ(run.result.status, RunStatus::Completed);
    EXPECT_EQ(run.result.output, "5\n");
}

TEST(Dispatcher, PrintfWithNativeValueRunsInline)
{
    api::Engine engine{withoutToolchains()};
    std::ostringstream out;
    api::RunOptions options;
    options.out = &out;
    auto run = compileAndRun(engine,
                             "#name \"Hello\"\n"
                             "py.message = \"Hi\"\n"
                             "cpp.printf(\"%s\\n\", message);\n",
                             options);
    EXPECT_EQ(run.result.status, RunStatus::Completed);
    EXPECT_EQ(run.result.output, "Hi\n");
    EXPECT_EQ(out.str(), "Hi\n");
    ASSERT_EQ(run.result.blocks.size(), 2u);
    EXPECT_EQ(run.result.blocks[1].status, BlockStatus::Ok);
}

TEST(Dispatcher, BadPrintfArgumentIsBlockError)
{
    api::Engine engine{withoutToolchains()};
    auto run = compileAndRun(engine,
                             "py.n = \"text\"\n"
                             "cpp.printf(\"%d\\n\", n);\n");
    EXPECT_EQ(run.result.status, RunStatus::CompletedWithErrors);
    ASSERT_EQ(run.result.blocks.size(), 2u);
    EXPECT_EQ(run.result.blocks[1].category, "PrintfError");
    EXPECT_EQ(run.result.diagnostics.errorCount(), 1u);
}

TEST(Dispatcher, PrintfBeforeNativeDefinitionIsNameError)
{
    api::Engine engine{withoutToolchains()};
    auto run = compileAndRun(engine,
                             "php.printf(\"%s\\n\", $x);\n"
                             "py.x = 10\n"
                             "php.printf(\"%s\\n\", $x);\n");
    EXPECT_EQ(run.result.status, RunStatus::CompletedWithErrors);
    ASSERT_EQ(run.result.blocks.size(), 3u);
    EXPECT_EQ(run.result.blocks[0].status, BlockStatus::Error);
    EXPECT_EQ(run.result.blocks[0].category, "NameError");
    EXPECT_EQ(run.result.blocks[2].status, BlockStatus::Ok);
    EXPECT_EQ(run.result.output, "10\n");

    ASSERT_EQ(run.result.diagnostics.errorCount(), 1u);
    const auto &d = run.result.diagnostics.diagnostics().front();
    EXPECT_EQ(d.code, "ExecutionError");
    EXPECT_EQ(d.message, "NameError: name 'x' is not defined (printf argument)");
    EXPECT_EQ(d.loc.line, 1u);
    EXPECT_EQ(run.result.exitCode(), 0);
}

TEST(Dispatcher, MissingToolchainFallsBackToStub)
{
    api::Engine engine{withoutToolchains()};
    auto run = compileAndRun(engine,
                             "py.print('a')\n"
                             "js.console.log(\"b\");\n"
                             "py.print('c')\n");
    EXPECT_EQ(run.result.status, RunStatus::Completed);
    ASSERT_EQ(run.result.blocks.size(), 3u);
    EXPECT_EQ(run.result.blocks[1].status, BlockStatus::Stub);
    EXPECT_EQ(run.result.blocks[1].category, "ToolchainUnavailable");
    EXPECT_EQ(run.result.output, "a\n[js stub, line 2: node not found]\nconsole.log(\"b\");\nc\n");
    EXPECT_EQ(run.result.diagnostics.warningCount(), 1u);
    EXPECT_EQ(run.result.diagnostics.diagnostics()[0].code, "ToolchainUnavailable");
}

TEST(Dispatcher, FailFallbackHaltsOnMissingToolchain)
{
    auto config = withoutToolchains();
    config.fallback = exec::FallbackPolicy::Fail;
    api::Engine engine{config};
    auto run = compileAndRun(engine, "rust.println!(\"x\");\npy.print('after')\n");
    EXPECT_EQ(run.result.status, RunStatus::Halted);
    ASSERT_EQ(run.result.blocks.size(), 1u);
    EXPECT_EQ(run.result.blocks[0].status, BlockStatus::Unavailable);
    EXPECT_EQ(run.result.output, "");
    EXPECT_EQ(run.result.exitCode(), 1);
}

TEST(Dispatcher, NativeErrorHaltsWithLocation)
{
    api::Engine engine{withoutToolchains()};
    auto run = compileAndRun(engine,
                             "py.print('start')\n"
                             "py.print(undefined_name)\n"
                             "py.print('never')\n");
    EXPECT_EQ(run.result.status, RunStatus::Halted);
    EXPECT_EQ(run.result.output, "start\n");
    ASSERT_EQ(run.result.blocks.size(), 2u);
    EXPECT_EQ(run.result.blocks[1].category, "NameError");

    ASSERT_EQ(run.result.diagnostics.errorCount(), 1u);
    const auto &d = run.result.diagnostics.diagnostics().back();
    EXPECT_EQ(d.code, "ExecutionError");
    EXPECT_EQ(d.loc.line, 2u);
    ASSERT_TRUE(d.block.has_value());
    EXPECT_EQ(*d.block, 1u);
}

TEST(Dispatcher, NativeTimeoutHalts)
{
    auto config = withoutToolchains();
    config.nativeTimeout = std::chrono::milliseconds(200);
    api::Engine engine{config};
    auto run = compileAndRun(engine, "py.while True:\npy.    pass\n");
    EXPECT_EQ(run.result.status, RunStatus::Halted);
    ASSERT_EQ(run.result.blocks.size(), 1u);
    EXPECT_EQ(run.result.blocks[0].status, BlockStatus::Timeout);
}

TEST(Dispatcher, SecurityViolationRunsNothing)
{
    api::Engine engine{withoutToolchains()};
    auto run = compileAndRun(engine, "py.print('hi')\ncpp.system(\"rm -rf /tmp/x\");\n");
    EXPECT_EQ(run.result.status, RunStatus::SecurityViolation);
    EXPECT_TRUE(run.result.blocks.empty());
    EXPECT_EQ(run.result.output, "");
    ASSERT_GE(run.result.diagnostics.errorCount(), 1u);
    EXPECT_EQ(run.result.diagnostics.diagnostics()[0].code, "SecurityViolation");
    EXPECT_EQ(run.result.exitCode(), 1);
}

TEST(Dispatcher, CancelledBeforeStart)
{
    api::Engine engine{withoutToolchains()};
    common::CancelToken token;
    token.cancel();
    api::RunOptions options;
    options.cancel = &token;
    auto run = compileAndRun(engine, "py.print(1)\n", options);
    EXPECT_EQ(run.result.status, RunStatus::Cancelled);
    EXPECT_TRUE(run.result.blocks.empty());
}

TEST(Dispatcher, SubprocessFailureDoesNotHalt)
{
    exec::ExecutorRegistry registry;
    registry.add(std::make_unique<exec::NativeExecutor>());
    registry.add(std::make_unique<FailingExecutor>());

    api::Engine engine;
    auto compiled = engine.compile("js.explode();\npy.print('still here')\n", "fail.lf");
    ASSERT_TRUE(compiled.succeeded());

    exec::Dispatcher dispatcher(registry);
    auto result = dispatcher.run(compiled.artifact->program, security::SecurityReport{});
    EXPECT_EQ(result.status, RunStatus::CompletedWithErrors);
    ASSERT_EQ(result.blocks.size(), 2u);
    EXPECT_EQ(result.blocks[0].status, BlockStatus::Error);
    EXPECT_EQ(result.blocks[0].err, "boom\n");
    EXPECT_EQ(result.output, "still here\n");
    EXPECT_EQ(result.exitCode(), 0);
}
