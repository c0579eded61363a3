// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/execution_controller.h"

#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "remedy/errors.h"

namespace remedy {

namespace fs = std::filesystem;

namespace {

std::mutex& runMutex() {
    static std::mutex m;
    return m;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

/// Restore point descriptions are embedded in a single-quoted string.
std::string safeDescription(const std::string& description) {
    std::string out;
    for (char c : description) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == ' ' || c == '-' ||
            c == ':' || c == '.' || c == '_') {
            out += c;
        }
    }
    if (out.size() > 200) out.resize(200);
    return out.empty() ? std::string("remedy") : out;
}

bool isSequenceNumber(const std::string& id) {
    if (id.empty() || id.size() > 10) return false;
    for (char c : id) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool findPointId(const std::string& stdoutText, std::string& id) {
    static const std::regex idPattern(R"(RESTORE_POINT_ID=(\d+))");
    std::smatch m;
    if (!std::regex_search(stdoutText, m, idPattern)) return false;
    id = m[1].str();
    return true;
}

/// Fills error and returns true when a restore point command did not complete cleanly.
bool commandFailure(const ProcessOutput& out, const std::string& shell, int timeoutSeconds,
                    std::string& error) {
    if (!out.launched) {
        error = "could not start " + shell + ": " + out.launchError;
    } else if (out.timedOut) {
        error = "timed out after " + std::to_string(timeoutSeconds) + "s";
    } else if (out.exitCode != 0) {
        std::string detail = trim(out.stderrText);
        error = detail.empty() ? "exit code " + std::to_string(out.exitCode) : detail;
    } else {
        return false;
    }
    return true;
}

/// Temporary script file, removed when it goes out of scope.
class ScriptFile {
public:
    ScriptFile(const std::string& directory, const std::string& text) {
        static std::atomic<unsigned> counter{0};
        fs::path dir = directory.empty() ? fs::temp_directory_path() : fs::path(directory);
        auto stamp = std::chrono::system_clock::now().time_since_epoch().count();
        path_ = dir / ("remedy_" + std::to_string(stamp) + "_" + std::to_string(counter++) + ".ps1");

        std::ofstream out(path_, std::ios::binary);
        if (!out) {
            throw std::runtime_error("Cannot write script file " + path_.string());
        }
        // Windows PowerShell reads BOM-less files as ANSI
        out << "\xEF\xBB\xBF" << text;
        out.close();
        if (!out) {
            throw std::runtime_error("Cannot write script file " + path_.string());
        }
    }

    ~ScriptFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    ScriptFile(const ScriptFile&) = delete;
    ScriptFile& operator=(const ScriptFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

// ---- PowerShellRestorePoint ----

PowerShellRestorePoint::PowerShellRestorePoint(ProcessRunner& runner, std::string shellExecutable,
                                               int timeoutSeconds)
    : runner_(runner), shell_(std::move(shellExecutable)), timeoutSeconds_(timeoutSeconds) {}

std::string PowerShellRestorePoint::buildScript(const std::string& description) {
    std::string s;
    s += "try {\n";
    s += "    Checkpoint-Computer -Description '" + safeDescription(description) +
         "' -RestorePointType MODIFY_SETTINGS -ErrorAction Stop\n";
    s += "    $rp = Get-ComputerRestorePoint | Sort-Object SequenceNumber -Descending | Select-Object -First 1\n";
    s += "    Write-Output (\"RESTORE_POINT_ID=\" + $rp.SequenceNumber)\n";
    s += "} catch {\n";
    s += "    [Console]::Error.WriteLine($_.Exception.Message)\n";
    s += "    exit 1\n";
    s += "}\n";
    return s;
}

std::string PowerShellRestorePoint::buildLatestScript(const std::string& descriptionPrefix) {
    std::string s;
    s += "try {\n";
    s += "    $rp = Get-ComputerRestorePoint -ErrorAction Stop |\n";
    s += "        Where-Object { $_.Description -like '" + safeDescription(descriptionPrefix) + "*' } |\n";
    s += "        Sort-Object SequenceNumber -Descending | Select-Object -First 1\n";
    s += "    if ($rp) { Write-Output (\"RESTORE_POINT_ID=\" + $rp.SequenceNumber) }\n";
    s += "} catch {\n";
    s += "    [Console]::Error.WriteLine($_.Exception.Message)\n";
    s += "    exit 1\n";
    s += "}\n";
    return s;
}

std::string PowerShellRestorePoint::buildRestoreScript(const std::string& id) {
    if (!isSequenceNumber(id)) {
        throw std::invalid_argument("Restore point id must be a sequence number, got '" + id + "'");
    }
    std::string s;
    s += "try {\n";
    s += "    Restore-Computer -RestorePoint " + id + " -Confirm:$false -ErrorAction Stop\n";
    s += "    Write-Output \"RESTORE_INITIATED\"\n";
    s += "} catch {\n";
    s += "    [Console]::Error.WriteLine($_.Exception.Message)\n";
    s += "    exit 1\n";
    s += "}\n";
    return s;
}

ProcessOutput PowerShellRestorePoint::runCommand(const std::string& script) {
    return runner_.run(
        {shell_, "-NoProfile", "-NonInteractive", "-ExecutionPolicy", "Bypass", "-Command", script},
        timeoutSeconds_);
}

RestorePointOutcome PowerShellRestorePoint::create(const std::string& description) {
    ProcessOutput out = runCommand(buildScript(description));

    RestorePointOutcome outcome;
    std::string id;
    if (!commandFailure(out, shell_, timeoutSeconds_, outcome.error)) {
        if (findPointId(out.stdoutText, id)) {
            outcome.created = true;
            outcome.id = id;
        } else {
            outcome.error = "restore point id not reported";
        }
    }
    return outcome;
}

RestorePointOutcome PowerShellRestorePoint::latest(const std::string& descriptionPrefix) {
    ProcessOutput out = runCommand(buildLatestScript(descriptionPrefix));

    RestorePointOutcome outcome;
    std::string id;
    if (!commandFailure(out, shell_, timeoutSeconds_, outcome.error)) {
        if (findPointId(out.stdoutText, id)) {
            outcome.created = true;
            outcome.id = id;
        } else {
            outcome.error = "no restore point created by remedy was found";
        }
    }
    return outcome;
}

RestoreOutcome PowerShellRestorePoint::restore(const std::string& id) {
    RestoreOutcome outcome;
    outcome.pointId = id;
    if (!isSequenceNumber(id)) {
        outcome.message = "invalid restore point id '" + id + "'";
        return outcome;
    }

    ProcessOutput out = runCommand(buildRestoreScript(id));
    if (!commandFailure(out, shell_, timeoutSeconds_, outcome.message)) {
        if (out.stdoutText.find("RESTORE_INITIATED") != std::string::npos) {
            outcome.initiated = true;
            outcome.message = "restore to point " + id + " initiated; the system will restart";
        } else {
            outcome.message = "Restore-Computer did not confirm the restore";
        }
    }
    return outcome;
}

// ---- ExecutionController ----

ExecutionController::ExecutionController(ProcessRunner& runner, RestorePointProvider& restorePoints,
                                         ExecutionConfig config)
    : runner_(runner), restorePoints_(restorePoints), config_(std::move(config)) {}

std::vector<std::string> ExecutionController::commandLine(const std::string& scriptPath) const {
    return {config_.shellExecutable, "-NoProfile", "-NonInteractive",
            "-ExecutionPolicy", "Bypass", "-File", scriptPath};
}

ExecutionResult ExecutionController::execute(const SanitizedScript& script, const SafetyReport& report) {
    if (!report.passed) {
        throw NotValidated("execute() requires a passing SafetyReport (" +
                           std::to_string(report.violations.size()) + " violation(s))");
    }
    if (script.empty()) {
        throw NotValidated("execute() called with an empty script");
    }

    std::unique_lock<std::mutex> lock(runMutex(), std::try_to_lock);
    if (!lock.owns_lock()) {
        throw ExecutionInProgress("A remediation script is already running");
    }

    ExecutionResult result;
    result.startedAt = std::chrono::system_clock::now();

    RestorePointOutcome restorePoint = restorePoints_.create(
        config_.restorePointDescription + " - " + formatTimestamp(result.startedAt));
    if (restorePoint.created) {
        result.restorePointId = restorePoint.id;
    } else {
        result.restorePointError = restorePoint.error;
        if (config_.restorePointPolicy == RestorePointPolicy::REQUIRED) {
            result.stderrText = "Restore point could not be created: " + restorePoint.error;
            result.finishedAt = std::chrono::system_clock::now();
            return result;
        }
    }

    try {
        ScriptFile file(config_.scriptDirectory, script.text);
        result.startedAt = std::chrono::system_clock::now();
        ProcessOutput out = runner_.run(commandLine(file.path()), config_.timeoutSeconds);

        result.launched = out.launched;
        result.exitCode = out.exitCode;
        result.stdoutText = std::move(out.stdoutText);
        result.stderrText = out.launched ? std::move(out.stderrText) : out.launchError;
        result.timedOut = out.timedOut;
        if (out.timedOut) {
            result.stderrText += "\nScript timed out after " + std::to_string(config_.timeoutSeconds) +
                                 "s and was terminated";
        }
    } catch (const std::exception& e) {
        // Script file could not be written; nothing was launched
        result.stderrText = e.what();
    }

    result.finishedAt = std::chrono::system_clock::now();
    return result;
}

RestoreOutcome ExecutionController::rollback(const std::string& id) {
    std::unique_lock<std::mutex> lock(runMutex(), std::try_to_lock);
    if (!lock.owns_lock()) {
        throw ExecutionInProgress("A remediation script is already running");
    }

    std::string target = trim(id);
    if (target.empty()) {
        RestorePointOutcome found = restorePoints_.latest(config_.restorePointDescription);
        if (!found.created) {
            RestoreOutcome outcome;
            outcome.message = "no restore point to roll back to: " + found.error;
            return outcome;
        }
        target = found.id;
    }
    return restorePoints_.restore(target);
}

// ---- Execution log ----

std::string formatExecutionLog(const SanitizedScript& script, const ExecutionResult& result) {
    std::ostringstream log;
    log << "Started:       " << formatTimestamp(result.startedAt) << "\n";
    log << "Finished:      " << formatTimestamp(result.finishedAt) << "\n";
    if (result.restorePointId) {
        log << "Restore point: " << *result.restorePointId << "\n";
    } else if (result.restorePointError) {
        log << "Restore point: not created (" << *result.restorePointError << ")\n";
    }
    log << "Launched:      " << (result.launched ? "yes" : "no") << "\n";
    log << "Exit code:     " << result.exitCode << "\n";
    log << "Timed out:     " << (result.timedOut ? "yes" : "no") << "\n";
    log << "Status:        " << (result.succeeded() ? "succeeded" : "failed") << "\n";

    log << "\n==== Script ====\n" << script.text;
    if (!script.text.empty() && script.text.back() != '\n') log << "\n";
    log << "\n==== stdout ====\n" << result.stdoutText;
    if (!result.stdoutText.empty() && result.stdoutText.back() != '\n') log << "\n";
    log << "\n==== stderr ====\n" << result.stderrText;
    if (!result.stderrText.empty() && result.stderrText.back() != '\n') log << "\n";
    return log.str();
}

} // namespace remedy
