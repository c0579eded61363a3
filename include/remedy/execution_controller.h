// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Confirmed, single-shot execution of a validated remediation script.

#pragma once

#include <string>
#include <vector>

#include "remedy/config.h"
#include "remedy/export.h"
#include "remedy/process_runner.h"
#include "remedy/types.h"

namespace remedy {

struct RestorePointOutcome {
    bool created = false;
    std::string id;
    std::string error;
};

struct RestoreOutcome {
    bool initiated = false;
    std::string pointId;
    std::string message;
};

/// Creates system restore points before remediation and rolls back to them.
class REMEDY_API RestorePointProvider {
public:
    virtual ~RestorePointProvider() = default;
    virtual RestorePointOutcome create(const std::string& description) = 0;

    /// Newest point whose description starts with descriptionPrefix.
    /// created is false (with error set) when there is none.
    virtual RestorePointOutcome latest(const std::string& descriptionPrefix) = 0;

    /// Starts a system restore to point id. The machine reboots once it is initiated.
    virtual RestoreOutcome restore(const std::string& id) = 0;
};

/// Checkpoint-Computer / Restore-Computer through the configured shell.
class REMEDY_API PowerShellRestorePoint : public RestorePointProvider {
public:
    PowerShellRestorePoint(ProcessRunner& runner, std::string shellExecutable, int timeoutSeconds);

    RestorePointOutcome create(const std::string& description) override;
    RestorePointOutcome latest(const std::string& descriptionPrefix) override;
    RestoreOutcome restore(const std::string& id) override;

    /// Script that creates the point and prints "RESTORE_POINT_ID=<n>".
    static std::string buildScript(const std::string& description);

    /// Script that prints "RESTORE_POINT_ID=<n>" for the newest matching point.
    static std::string buildLatestScript(const std::string& descriptionPrefix);

    /// Script that restores to point id and prints "RESTORE_INITIATED".
    /// id must be a sequence number.
    static std::string buildRestoreScript(const std::string& id);

private:
    ProcessOutput runCommand(const std::string& script);

    ProcessRunner& runner_;
    std::string shell_;
    int timeoutSeconds_;
};

struct ExecutionConfig {
    std::string shellExecutable = defaultShellExecutable();
    int timeoutSeconds = 300;
    RestorePointPolicy restorePointPolicy = RestorePointPolicy::BEST_EFFORT;
    std::string restorePointDescription = "remedy remediation";
    std::string scriptDirectory;   // empty = system temp directory
};

/// Runs a script only when its SafetyReport passed.
///
/// Sequence: restore point (best-effort or required per policy), write the script
/// to a temporary .ps1, run it in a fresh child process, capture output, delete the
/// file. Never retries. At most one execute() is in flight per process.
class REMEDY_API ExecutionController {
public:
    ExecutionController(ProcessRunner& runner, RestorePointProvider& restorePoints,
                        ExecutionConfig config);

    /// Throws NotValidated if report.passed is false or the script is empty; nothing
    /// is launched or written in that case. Throws ExecutionInProgress if another
    /// run holds the process-wide lock.
    ExecutionResult execute(const SanitizedScript& script, const SafetyReport& report);

    /// Restores the system to point id, or to the newest point this tool
    /// created when id is empty. Shares the process-wide lock with execute().
    RestoreOutcome rollback(const std::string& id = "");

    /// Shell argv used to run a script file.
    std::vector<std::string> commandLine(const std::string& scriptPath) const;

private:
    ProcessRunner& runner_;
    RestorePointProvider& restorePoints_;
    ExecutionConfig config_;
};

/// Plain-text execution log: timestamps, restore point, exit status, then the
/// script and its complete stdout and stderr.
REMEDY_API std::string formatExecutionLog(const SanitizedScript& script, const ExecutionResult& result);

} // namespace remedy
