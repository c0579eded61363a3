// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <remedy/process_runner.h>

#include <chrono>

using namespace remedy;

// These exercise the POSIX implementation through /bin/sh.
#ifndef _WIN32

TEST(SubprocessRunnerTest, CapturesStdoutAndExitCode) {
    SubprocessRunner runner;
    auto out = runner.run({"/bin/sh", "-c", "echo hello; exit 3"}, 10);

    EXPECT_TRUE(out.launched);
    EXPECT_FALSE(out.timedOut);
    EXPECT_EQ(out.exitCode, 3);
    EXPECT_EQ(out.stdoutText, "hello\n");
    EXPECT_TRUE(out.stderrText.empty());
}

TEST(SubprocessRunnerTest, SeparatesStderr) {
    SubprocessRunner runner;
    auto out = runner.run({"/bin/sh", "-c", "echo out; echo err 1>&2"}, 10);

    EXPECT_EQ(out.exitCode, 0);
    EXPECT_EQ(out.stdoutText, "out\n");
    EXPECT_EQ(out.stderrText, "err\n");
}

TEST(SubprocessRunnerTest, ArgumentsPassedVerbatim) {
    SubprocessRunner runner;
    auto out = runner.run({"/bin/sh", "-c", "printf '%s|' \"$@\"", "sh", "a b", "$HOME", "'q'"}, 10);
    EXPECT_EQ(out.stdoutText, "a b|$HOME|'q'|");
}

TEST(SubprocessRunnerTest, StdinIsClosed) {
    SubprocessRunner runner;
    auto out = runner.run({"/bin/sh", "-c", "cat; echo done"}, 10);
    EXPECT_FALSE(out.timedOut);
    EXPECT_EQ(out.stdoutText, "done\n");
}

TEST(SubprocessRunnerTest, LargeOutputOnBothStreams) {
    SubprocessRunner runner;
    auto out = runner.run(
        {"/bin/sh", "-c", "i=0; while [ $i -lt 2000 ]; do echo 0123456789012345678901234567890123456789; "
                          "echo e0123456789012345678901234567890123456789 1>&2; i=$((i+1)); done"},
        30);

    EXPECT_EQ(out.exitCode, 0);
    EXPECT_EQ(out.stdoutText.size(), 2000u * 41u);
    EXPECT_EQ(out.stderrText.size(), 2000u * 42u);
}

TEST(SubprocessRunnerTest, TimeoutKillsChild) {
    SubprocessRunner runner;
    auto start = std::chrono::steady_clock::now();
    auto out = runner.run({"/bin/sh", "-c", "exec sleep 30"}, 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(out.launched);
    EXPECT_TRUE(out.timedOut);
    EXPECT_NE(out.exitCode, 0);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(), 10);
}

TEST(SubprocessRunnerTest, MissingExecutableExits127) {
    SubprocessRunner runner;
    auto out = runner.run({"/nonexistent/remedy-shell"}, 10);
    EXPECT_TRUE(out.launched);
    EXPECT_EQ(out.exitCode, 127);
    EXPECT_FALSE(out.stderrText.empty());
}

#endif

TEST(SubprocessRunnerTest, EmptyCommandLineNotLaunched) {
    SubprocessRunner runner;
    auto out = runner.run({}, 10);
    EXPECT_FALSE(out.launched);
    EXPECT_EQ(out.launchError, "empty command line");
}
