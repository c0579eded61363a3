// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <remedy/errors.h>
#include <remedy/execution_controller.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <thread>

using namespace remedy;

// ---- Fakes ----

namespace {

class RecordingRunner : public ProcessRunner {
public:
    ProcessOutput result;
    std::vector<std::vector<std::string>> calls;
    std::vector<int> timeouts;
    std::string scriptSeen;                          // contents of the -File argument while running
    std::function<void()> duringRun;

    RecordingRunner() {
        result.launched = true;
        result.exitCode = 0;
        result.stdoutText = "[FIXED] done\n";
    }

    ProcessOutput run(const std::vector<std::string>& argv, int timeoutSeconds) override {
        calls.push_back(argv);
        timeouts.push_back(timeoutSeconds);
        if (!argv.empty()) {
            std::ifstream in(argv.back(), std::ios::binary);
            scriptSeen.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }
        if (duringRun) duringRun();
        return result;
    }
};

class FakeRestorePoint : public RestorePointProvider {
public:
    RestorePointOutcome outcome;
    int calls = 0;
    std::string lastDescription;
    std::string lastPrefix;
    std::vector<std::string> restored;

    FakeRestorePoint() {
        outcome.created = true;
        outcome.id = "42";
    }

    RestorePointOutcome create(const std::string& description) override {
        ++calls;
        lastDescription = description;
        return outcome;
    }

    RestorePointOutcome latest(const std::string& descriptionPrefix) override {
        lastPrefix = descriptionPrefix;
        return outcome;
    }

    RestoreOutcome restore(const std::string& id) override {
        restored.push_back(id);
        return RestoreOutcome{true, id, "restore to point " + id + " initiated"};
    }
};

SanitizedScript script(const std::string& text = "Write-Host 'ok'\n") {
    SanitizedScript s;
    s.text = text;
    return s;
}

SafetyReport passing() {
    SafetyReport r;
    r.passed = true;
    return r;
}

ExecutionConfig testConfig() {
    ExecutionConfig config;
    config.shellExecutable = "pwsh";
    config.timeoutSeconds = 77;
    return config;
}

} // namespace

// ---- Validation gate ----

TEST(ExecutionControllerTest, RejectsFailedReport) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    SafetyReport failed;
    failed.passed = false;
    failed.violations.push_back({SafetyRule::FORBIDDEN_COMMAND, 1, "Restart-Computer", "reboot"});

    EXPECT_THROW(controller.execute(script(), failed), NotValidated);
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_EQ(restore.calls, 0);
}

TEST(ExecutionControllerTest, RejectsEmptyScript) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    EXPECT_THROW(controller.execute(SanitizedScript{}, passing()), NotValidated);
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_EQ(restore.calls, 0);
}

// ---- Successful run ----

TEST(ExecutionControllerTest, RunsScriptThroughShell) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    auto result = controller.execute(script("Write-Host 'hi'\n"), passing());

    ASSERT_EQ(runner.calls.size(), 1u);
    const auto& argv = runner.calls[0];
    ASSERT_EQ(argv.size(), 7u);
    EXPECT_EQ(argv[0], "pwsh");
    EXPECT_EQ(argv[5], "-File");
    EXPECT_EQ(std::filesystem::path(argv[6]).extension(), ".ps1");
    EXPECT_EQ(runner.timeouts[0], 77);

    EXPECT_EQ(runner.scriptSeen, "\xEF\xBB\xBFWrite-Host 'hi'\n");
    EXPECT_FALSE(std::filesystem::exists(argv[6]));

    EXPECT_TRUE(result.launched);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.stdoutText, "[FIXED] done\n");
    ASSERT_TRUE(result.restorePointId.has_value());
    EXPECT_EQ(*result.restorePointId, "42");
    EXPECT_FALSE(result.restorePointError.has_value());
    EXPECT_LE(result.startedAt, result.finishedAt);
}

TEST(ExecutionControllerTest, RestorePointDescriptionIsTimestamped) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());
    controller.execute(script(), passing());

    EXPECT_EQ(restore.calls, 1);
    EXPECT_EQ(restore.lastDescription.rfind("remedy remediation - ", 0), 0u);
}

TEST(ExecutionControllerTest, CommandLine) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    std::vector<std::string> expected = {"pwsh", "-NoProfile", "-NonInteractive", "-ExecutionPolicy",
                                         "Bypass", "-File", "x.ps1"};
    EXPECT_EQ(controller.commandLine("x.ps1"), expected);
}

// ---- Failures ----

TEST(ExecutionControllerTest, NonZeroExitIsReportedNotThrown) {
    RecordingRunner runner;
    runner.result.exitCode = 1;
    runner.result.stderrText = "Access is denied.";
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    auto result = controller.execute(script(), passing());
    EXPECT_TRUE(result.launched);
    EXPECT_EQ(result.exitCode, 1);
    EXPECT_EQ(result.stderrText, "Access is denied.");
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(runner.calls.size(), 1u);
}

TEST(ExecutionControllerTest, TimeoutAnnotatesStderr) {
    RecordingRunner runner;
    runner.result.timedOut = true;
    runner.result.exitCode = 137;
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    auto result = controller.execute(script(), passing());
    EXPECT_TRUE(result.timedOut);
    EXPECT_NE(result.stderrText.find("timed out after 77s"), std::string::npos);
    EXPECT_FALSE(result.succeeded());
}

TEST(ExecutionControllerTest, LaunchFailureUsesLaunchError) {
    RecordingRunner runner;
    runner.result = ProcessOutput{};
    runner.result.launchError = "pwsh not found";
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    auto result = controller.execute(script(), passing());
    EXPECT_FALSE(result.launched);
    EXPECT_EQ(result.stderrText, "pwsh not found");
}

TEST(ExecutionControllerTest, UnwritableScriptDirectory) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    ExecutionConfig config = testConfig();
    config.scriptDirectory = "/nonexistent/remedy/scripts";
    ExecutionController controller(runner, restore, config);

    auto result = controller.execute(script(), passing());
    EXPECT_FALSE(result.launched);
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_NE(result.stderrText.find("Cannot write script file"), std::string::npos);
}

// ---- Restore point policy ----

TEST(ExecutionControllerTest, BestEffortRestorePointFailureContinues) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    restore.outcome = RestorePointOutcome{false, "", "System Restore is disabled"};
    ExecutionController controller(runner, restore, testConfig());

    auto result = controller.execute(script(), passing());
    EXPECT_EQ(runner.calls.size(), 1u);
    EXPECT_TRUE(result.succeeded());
    EXPECT_FALSE(result.restorePointId.has_value());
    ASSERT_TRUE(result.restorePointError.has_value());
    EXPECT_EQ(*result.restorePointError, "System Restore is disabled");
}

TEST(ExecutionControllerTest, RequiredRestorePointFailureBlocksRun) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    restore.outcome = RestorePointOutcome{false, "", "System Restore is disabled"};
    ExecutionConfig config = testConfig();
    config.restorePointPolicy = RestorePointPolicy::REQUIRED;
    ExecutionController controller(runner, restore, config);

    auto result = controller.execute(script(), passing());
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_FALSE(result.launched);
    EXPECT_FALSE(result.succeeded());
    EXPECT_NE(result.stderrText.find("System Restore is disabled"), std::string::npos);
}

// ---- Single flight ----

TEST(ExecutionControllerTest, ConcurrentExecuteRejected) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    bool rejected = false;
    runner.duringRun = [&]() {
        RecordingRunner innerRunner;
        FakeRestorePoint innerRestore;
        ExecutionController other(innerRunner, innerRestore, testConfig());
        std::thread t([&]() {
            try {
                other.execute(script(), passing());
            } catch (const ExecutionInProgress&) {
                rejected = true;
            }
        });
        t.join();
    };

    controller.execute(script(), passing());
    EXPECT_TRUE(rejected);

    // The lock is released once the first run returns
    runner.duringRun = nullptr;
    EXPECT_NO_THROW(controller.execute(script(), passing()));
}

// ---- PowerShellRestorePoint ----

TEST(PowerShellRestorePointTest, ParsesReportedId) {
    RecordingRunner runner;
    runner.result.stdoutText = "RESTORE_POINT_ID=117\r\n";
    PowerShellRestorePoint provider(runner, "powershell", 120);

    auto outcome = provider.create("remedy remediation");
    EXPECT_TRUE(outcome.created);
    EXPECT_EQ(outcome.id, "117");
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0][0], "powershell");
    EXPECT_EQ(runner.calls[0][5], "-Command");
    EXPECT_EQ(runner.timeouts[0], 120);
}

TEST(PowerShellRestorePointTest, ReportsFailure) {
    RecordingRunner runner;
    runner.result.exitCode = 1;
    runner.result.stdoutText.clear();
    runner.result.stderrText = "The service cannot be started\n";
    PowerShellRestorePoint provider(runner, "powershell", 120);

    auto outcome = provider.create("x");
    EXPECT_FALSE(outcome.created);
    EXPECT_EQ(outcome.error, "The service cannot be started");
}

TEST(PowerShellRestorePointTest, MissingIdIsFailure) {
    RecordingRunner runner;
    runner.result.stdoutText = "ok\n";
    PowerShellRestorePoint provider(runner, "powershell", 120);
    EXPECT_FALSE(provider.create("x").created);
}

TEST(PowerShellRestorePointTest, DescriptionCannotBreakQuoting) {
    std::string script = PowerShellRestorePoint::buildScript("fix'; Remove-Item C:\\ -Recurse; '");
    EXPECT_EQ(script.find("fix'"), std::string::npos);
    EXPECT_NE(script.find("-ErrorAction Stop"), std::string::npos);
    EXPECT_NE(script.find("RESTORE_POINT_ID="), std::string::npos);
}

TEST(PowerShellRestorePointTest, LatestFiltersByDescription) {
    RecordingRunner runner;
    runner.result.stdoutText = "RESTORE_POINT_ID=118\n";
    PowerShellRestorePoint provider(runner, "powershell", 120);

    auto outcome = provider.latest("remedy remediation");
    EXPECT_TRUE(outcome.created);
    EXPECT_EQ(outcome.id, "118");
    ASSERT_EQ(runner.calls.size(), 1u);
    const std::string& script = runner.calls[0].back();
    EXPECT_NE(script.find("Get-ComputerRestorePoint"), std::string::npos);
    EXPECT_NE(script.find("-like 'remedy remediation*'"), std::string::npos);
}

TEST(PowerShellRestorePointTest, LatestWithNoMatch) {
    RecordingRunner runner;
    runner.result.stdoutText.clear();
    PowerShellRestorePoint provider(runner, "powershell", 120);

    auto outcome = provider.latest("remedy remediation");
    EXPECT_FALSE(outcome.created);
    EXPECT_NE(outcome.error.find("no restore point"), std::string::npos);
}

TEST(PowerShellRestorePointTest, RestoreRunsRestoreComputer) {
    RecordingRunner runner;
    runner.result.stdoutText = "RESTORE_INITIATED\r\n";
    PowerShellRestorePoint provider(runner, "powershell", 120);

    auto outcome = provider.restore("117");
    EXPECT_TRUE(outcome.initiated);
    EXPECT_EQ(outcome.pointId, "117");
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_NE(runner.calls[0].back().find("Restore-Computer -RestorePoint 117 -Confirm:$false"),
              std::string::npos);
}

TEST(PowerShellRestorePointTest, RestoreFailureIsReported) {
    RecordingRunner runner;
    runner.result.exitCode = 1;
    runner.result.stdoutText.clear();
    runner.result.stderrText = "Restore point 9 does not exist\n";
    PowerShellRestorePoint provider(runner, "powershell", 120);

    auto outcome = provider.restore("9");
    EXPECT_FALSE(outcome.initiated);
    EXPECT_EQ(outcome.message, "Restore point 9 does not exist");
}

TEST(PowerShellRestorePointTest, RestoreRejectsNonNumericId) {
    RecordingRunner runner;
    PowerShellRestorePoint provider(runner, "powershell", 120);

    auto outcome = provider.restore("1; Remove-Item C:\\ -Recurse");
    EXPECT_FALSE(outcome.initiated);
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_THROW(PowerShellRestorePoint::buildRestoreScript("abc"), std::invalid_argument);
}

// ---- Rollback ----

TEST(ExecutionControllerTest, RollbackToExplicitPoint) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    auto outcome = controller.rollback("17");
    EXPECT_TRUE(outcome.initiated);
    ASSERT_EQ(restore.restored.size(), 1u);
    EXPECT_EQ(restore.restored[0], "17");
    EXPECT_TRUE(restore.lastPrefix.empty());
    EXPECT_TRUE(runner.calls.empty());
}

TEST(ExecutionControllerTest, RollbackDefaultsToNewestOwnPoint) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    auto outcome = controller.rollback();
    EXPECT_TRUE(outcome.initiated);
    EXPECT_EQ(restore.lastPrefix, "remedy remediation");
    ASSERT_EQ(restore.restored.size(), 1u);
    EXPECT_EQ(restore.restored[0], "42");
}

TEST(ExecutionControllerTest, RollbackWithoutAnyPoint) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    restore.outcome = RestorePointOutcome{false, "", "no restore point created by remedy was found"};
    ExecutionController controller(runner, restore, testConfig());

    auto outcome = controller.rollback();
    EXPECT_FALSE(outcome.initiated);
    EXPECT_TRUE(restore.restored.empty());
    EXPECT_NE(outcome.message.find("no restore point"), std::string::npos);
}

TEST(ExecutionControllerTest, RollbackRejectedWhileScriptRuns) {
    RecordingRunner runner;
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    bool rejected = false;
    runner.duringRun = [&]() {
        FakeRestorePoint innerRestore;
        RecordingRunner innerRunner;
        ExecutionController other(innerRunner, innerRestore, testConfig());
        std::thread t([&]() {
            try {
                other.rollback("5");
            } catch (const ExecutionInProgress&) {
                rejected = true;
            }
        });
        t.join();
    };

    controller.execute(script(), passing());
    EXPECT_TRUE(rejected);
    EXPECT_TRUE(restore.restored.empty());
}

// ---- Execution log ----

TEST(ExecutionLogTest, ContainsTimestampsAndFullOutput) {
    RecordingRunner runner;
    runner.result.exitCode = 1;
    runner.result.stdoutText = "[FIXED] cache\n" + std::string(10000, 'o');
    runner.result.stderrText = "Access is denied.";
    FakeRestorePoint restore;
    ExecutionController controller(runner, restore, testConfig());

    SanitizedScript s = script("Write-Host 'hi'\n");
    auto result = controller.execute(s, passing());
    std::string log = formatExecutionLog(s, result);

    EXPECT_NE(log.find("Started:       " + formatTimestamp(result.startedAt)), std::string::npos);
    EXPECT_NE(log.find("Finished:      " + formatTimestamp(result.finishedAt)), std::string::npos);
    EXPECT_NE(log.find("Restore point: 42"), std::string::npos);
    EXPECT_NE(log.find("Exit code:     1"), std::string::npos);
    EXPECT_NE(log.find("Status:        failed"), std::string::npos);
    EXPECT_NE(log.find("==== Script ====\nWrite-Host 'hi'\n"), std::string::npos);
    EXPECT_NE(log.find(runner.result.stdoutText), std::string::npos);
    EXPECT_NE(log.find("==== stderr ====\nAccess is denied.\n"), std::string::npos);
}

TEST(ExecutionLogTest, RecordsMissingRestorePoint) {
    ExecutionResult result;
    result.restorePointError = std::string("System Restore is disabled");
    std::string log = formatExecutionLog(script(), result);

    EXPECT_NE(log.find("Restore point: not created (System Restore is disabled)"), std::string::npos);
    EXPECT_NE(log.find("Launched:      no"), std::string::npos);
}
