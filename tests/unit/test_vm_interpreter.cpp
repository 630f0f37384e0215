// File: tests/unit/test_vm_interpreter.cpp
// Purpose: Run native blocks through the native executor and check output,
//          environment effects and guest error reporting.
// Key invariants: Blocks share one environment; a guest exception reports
//                 its kind and the .lf line it was raised on.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/exec/NativeExecutor.cpp, src/vm/Interpreter.cpp, src/vm/Format.cpp

#include "exec/NativeExecutor.hpp"
#include "vm/Environment.hpp"
#include "vm/Format.hpp"
#include "vm/NativeError.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace fusion;

namespace
{
exec::ExecutionOutcome runBlock(exec::NativeExecutor &exe,
                                vm::Environment &env,
                                const std::string &code,
                                uint32_t line = 1)
{
    exec::BlockRequest req;
    req.code = code;
    req.line = line;
    req.timeout = std::chrono::milliseconds(5000);
    return exe.execute(req, env);
}
} // namespace

TEST(VmInterpreter, ArithmeticAndPrinting)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    auto out = runBlock(exe, env,
                        "print(7 // 2, 7 % 3, 2 ** 10, 7 / 2)\n"
                        "print(-7 // 2, 1 == 1.0, 'a' * 3)\n"
                        "print(1, 2, sep='-', end='!\\n')\n");
    ASSERT_EQ(out.status, exec::BlockStatus::Ok) << out.err;
    EXPECT_EQ(out.out, "3 1 1024 3.5\n-4 True aaa\n1-2!\n");
}

TEST(VmInterpreter, ForLoopsUnpackBreakAndElse)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    auto out = runBlock(exe, env,
                        "total = 0\n"
                        "for i in range(10):\n"
                        "    if i % 2:\n"
                        "        continue\n"
                        "    if i > 6:\n"
                        "        break\n"
                        "    total += i\n"
                        "for k, v in {'a': 1, 'b': 2}.items():\n"
                        "    print(k, v)\n"
                        "else:\n"
                        "    print('done', total)\n");
    ASSERT_EQ(out.status, exec::BlockStatus::Ok) << out.err;
    EXPECT_EQ(out.out, "a 1\nb 2\ndone 12\n");
}

TEST(VmInterpreter, SleepWaitsAndValidatesLength)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    auto out = runBlock(exe, env,
                        "import time\n"
                        "t0 = time.monotonic()\n"
                        "time.sleep(0.05)\n"
                        "print(time.monotonic() - t0 >= 0.04)\n");
    ASSERT_EQ(out.status, exec::BlockStatus::Ok) << out.err;
    EXPECT_EQ(out.out, "True\n");

    auto bad = runBlock(exe, env, "time.sleep(-1)");
    EXPECT_EQ(bad.category, "ValueError");
}

TEST(VmInterpreter, StateCarriesAcrossBlocks)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    ASSERT_TRUE(runBlock(exe, env, "def double(x):\n    return x * 2\n").succeeded());
    auto second = runBlock(exe, env, "n = double(21)", 3);
    ASSERT_TRUE(second.succeeded());
    ASSERT_TRUE(second.environmentDelta.has_value());
    EXPECT_EQ(second.environmentDelta->size(), 1u);
    EXPECT_EQ((*second.environmentDelta)[0], "n");

    const vm::Value *n = env.lookup("n");
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(n->asInt(), 42);
    EXPECT_EQ(env.functions().count("double"), 1u);
}

TEST(VmInterpreter, ContainersAndComprehensions)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    auto out = runBlock(exe, env,
                        "xs = [n * n for n in range(5) if n % 2 == 0]\n"
                        "d = {'a': 1, 'b': 2}\n"
                        "d['c'] = len(xs)\n"
                        "xs.append(99)\n"
                        "print(xs, sorted(d.keys(), reverse=True), d)\n"
                        "print(xs[1:3], (1,), sum(xs))\n");
    ASSERT_EQ(out.status, exec::BlockStatus::Ok) << out.err;
    EXPECT_EQ(out.out,
              "[0, 4, 16, 99] ['c', 'b', 'a'] {'a': 1, 'b': 2, 'c': 3}\n"
              "[4, 16] (1,) 119\n");
}

TEST(VmInterpreter, StringFormatting)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    auto out = runBlock(exe, env,
                        "name = 'Ada'\n"
                        "print(f'{name}:{3.14159:.2f}:{42:>5}')\n"
                        "print('%s is %d' % (name, 36))\n"
                        "print('{} + {}'.format(1, 2.0))\n");
    ASSERT_EQ(out.status, exec::BlockStatus::Ok) << out.err;
    EXPECT_EQ(out.out, "Ada:3.14:   42\nAda is 36\n1 + 2.0\n");
}

TEST(VmInterpreter, ExceptionsAreCaughtByKind)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    auto out = runBlock(exe, env,
                        "try:\n"
                        "    x = 1 / 0\n"
                        "except ZeroDivisionError:\n"
                        "    print('caught')\n"
                        "finally:\n"
                        "    print('done')\n");
    ASSERT_EQ(out.status, exec::BlockStatus::Ok) << out.err;
    EXPECT_EQ(out.out, "caught\ndone\n");
}

TEST(VmInterpreter, UncaughtErrorReportsKindAndLine)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    auto out = runBlock(exe, env, "print('before')\nprint(missing)\n", 10);
    EXPECT_EQ(out.status, exec::BlockStatus::Error);
    EXPECT_EQ(out.category, "NameError");
    EXPECT_EQ(out.out, "before\n");
    ASSERT_TRUE(out.nativeError.has_value());
    EXPECT_EQ(out.nativeError->kind, vm::NativeErrorKind::NameError);
    EXPECT_EQ(out.nativeError->line, 11u);
    EXPECT_EQ(out.err.rfind("NameError: ", 0), 0u);
}

TEST(VmInterpreter, SyntaxErrorIsCategorized)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    auto out = runBlock(exe, env, "x = = 1", 4);
    EXPECT_EQ(out.status, exec::BlockStatus::Error);
    EXPECT_EQ(out.category, "SyntaxError");
    ASSERT_TRUE(out.nativeError.has_value());
    EXPECT_EQ(out.nativeError->line, 4u);
}

TEST(VmInterpreter, StepBudgetStopsRunawayLoops)
{
    exec::NativeExecutor exe(exec::NativeLimits{10000, 400});
    vm::Environment env;
    auto out = runBlock(exe, env, "while True:\n    pass\n");
    EXPECT_EQ(out.status, exec::BlockStatus::Timeout);
}

TEST(VmInterpreter, RecursionLimit)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    auto out = runBlock(exe, env, "def f(n):\n    return f(n + 1)\nf(0)\n");
    EXPECT_EQ(out.status, exec::BlockStatus::Error);
    EXPECT_EQ(out.category, "RecursionError");
}

TEST(VmInterpreter, SandboxImports)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    ASSERT_TRUE(exe.preload("math", 1, env).hasValue());
    auto out = runBlock(exe, env, "print(math.floor(math.sqrt(17)))");
    ASSERT_EQ(out.status, exec::BlockStatus::Ok) << out.err;
    EXPECT_EQ(out.out, "4\n");

    auto denied = exe.preload("socket", 2, env);
    ASSERT_FALSE(denied.hasValue());
    EXPECT_EQ(denied.error().code, "ImportError");

    auto inBlock = runBlock(exe, env, "import os");
    EXPECT_EQ(inBlock.category, "ImportError");
}

TEST(VmInterpreter, TryEvaluateRejectsUnboundNames)
{
    exec::NativeExecutor exe;
    vm::Environment env;
    env.assign("count", vm::Value::integer(3));
    const auto ms = std::chrono::milliseconds(1000);

    auto bound = exe.tryEvaluate("count * 2 + len([1, 2])", 1, env, ms, nullptr);
    ASSERT_TRUE(bound.has_value());
    EXPECT_EQ(bound->asInt(), 8);

    try
    {
        (void)exe.tryEvaluate("i + 1", 7, env, ms, nullptr);
        FAIL() << "expected a NameError";
    }
    catch (const vm::NativeTrap &trap)
    {
        EXPECT_EQ(trap.error().kind, vm::NativeErrorKind::NameError);
        EXPECT_EQ(trap.error().line, 7u);
    }
    EXPECT_FALSE(exe.tryEvaluate("std::string(\"x\")", 1, env, ms, nullptr).has_value());
    EXPECT_TRUE(exe.tryEvaluate("[k for k in range(count)]", 1, env, ms, nullptr).has_value());
}

TEST(VmFormat, FloatRepr)
{
    EXPECT_EQ(vm::formatFloatRepr(2.0), "2.0");
    EXPECT_EQ(vm::formatFloatRepr(0.1), "0.1");
    EXPECT_EQ(vm::formatFloatRepr(1e16), "1e+16");
    EXPECT_EQ(vm::formatFloatRepr(-0.0), "-0.0");
}
