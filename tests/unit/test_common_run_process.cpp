// File: tests/unit/test_common_run_process.cpp
// Purpose: Verify subprocess capture, exit status, stdin, timeouts and launch
//          failures of the process runner used by guest executors.
// Key invariants: A timed-out child is killed and reported as timed out; a
//                 missing executable never throws; stdin reaches EOF once the
//                 input is written.
// Ownership/Lifetime: Spawned children terminate before each test returns.
// Links: src/common/RunProcess.cpp

#include "common/RunProcess.hpp"

#include <gtest/gtest.h>

#include <signal.h>

#include <chrono>
#include <filesystem>
#include <string>

using namespace fusion::common;

#ifndef _WIN32
TEST(RunProcess, CapturesBothStreamsAndExitCode)
{
    const RunResult r = run_process({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"});
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.out, "out\n");
    EXPECT_EQ(r.err, "err\n");
    EXPECT_FALSE(r.timed_out);
    EXPECT_FALSE(r.launch_failed);
}

TEST(RunProcess, FeedsStandardInput)
{
    RunOptions opts;
    opts.input = "hello\n";
    opts.timeout = std::chrono::milliseconds(5000);
    const RunResult r = run_process({"/bin/sh", "-c", "cat; echo done"}, opts);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.out, "hello\ndone\n");
}

TEST(RunProcess, LargeInputAndOutputDoNotDeadlock)
{
    RunOptions opts;
    opts.input.assign(512 * 1024, 'x');
    opts.timeout = std::chrono::milliseconds(10000);
    const RunResult r = run_process({"/bin/sh", "-c", "cat"}, opts);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.out.size(), opts.input.size());
}

TEST(RunProcess, ChildIgnoringInputLeavesSigpipeDisposition)
{
    struct sigaction before{};
    ASSERT_EQ(::sigaction(SIGPIPE, nullptr, &before), 0);

    RunOptions opts;
    opts.input.assign(512 * 1024, 'y');
    opts.timeout = std::chrono::milliseconds(5000);
    const RunResult r = run_process({"/bin/sh", "-c", "exit 0"}, opts);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 0);

    struct sigaction after{};
    ASSERT_EQ(::sigaction(SIGPIPE, nullptr, &after), 0);
    EXPECT_EQ(after.sa_handler, before.sa_handler);
}

TEST(RunProcess, HonoursWorkingDirectoryAndEnvironment)
{
    const auto tmp = std::filesystem::temp_directory_path();
    RunOptions opts;
    opts.cwd = tmp.string();
    opts.env = {{"FUSION_PROBE", "42"}};
    const RunResult r = run_process({"/bin/sh", "-c", "pwd; echo $FUSION_PROBE"}, opts);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_NE(r.out.find("42"), std::string::npos);
    EXPECT_EQ(std::filesystem::canonical(r.out.substr(0, r.out.find('\n'))), std::filesystem::canonical(tmp));
}

TEST(RunProcess, TimeoutKillsChild)
{
    RunOptions opts;
    opts.timeout = std::chrono::milliseconds(200);
    const auto start = std::chrono::steady_clock::now();
    const RunResult r = run_process({"/bin/sh", "-c", "sleep 5"}, opts);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(r.timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

TEST(RunProcess, CancelledTokenStopsChild)
{
    CancelToken token;
    token.cancel();
    RunOptions opts;
    opts.cancel = &token;
    const RunResult r = run_process({"/bin/sh", "-c", "sleep 5"}, opts);
    EXPECT_TRUE(r.cancelled);
}

TEST(RunProcess, MissingExecutableReportsLaunchFailure)
{
    const RunResult r = run_process({"/nonexistent/fusion-tool"});
    EXPECT_TRUE(r.launch_failed);
    EXPECT_EQ(r.exit_code, -1);
}
#endif
