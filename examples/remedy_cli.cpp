// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Command-line front end: resolves configuration, loads a telemetry snapshot,
// runs the diagnostic pipeline once and saves the HTML report.
//
// Usage:
//   remedy_cli --problem "PC is slow" --telemetry snapshot.json [options]
//
// Options:
//   --config FILE              persisted JSON configuration
//   --base-url URL             OpenAI-compatible endpoint (default http://localhost:8000/api/v1)
//   --model ID                 model id
//   --api-key KEY              API key (prefer REMEDY_API_KEY)
//   --require-api-key          prompt for a key if none is configured
//   --scan-depth quick|deep|complete
//   --restore-point-policy best_effort|required
//   --report-dir DIR
//   --shell EXE                PowerShell executable
//   --model-timeout SECONDS
//   --exec-timeout SECONDS
//   --dry-run                  never execute, only show the script and its checks
//   --rollback [ID]            restore to point ID (default: newest one remedy created) and exit
//   --debug, --show-prompts

#include <iostream>
#include <string>

#include <remedy/config.h>
#include <remedy/errors.h>
#include <remedy/pipeline.h>

#ifdef _WIN32
#include <windows.h>
#endif

namespace {

void printUsage() {
    std::cout << "Usage: remedy_cli --problem TEXT [--telemetry FILE] [--config FILE]\n"
              << "                  [--base-url URL] [--model ID] [--api-key KEY] [--require-api-key]\n"
              << "                  [--scan-depth quick|deep|complete]\n"
              << "                  [--restore-point-policy best_effort|required]\n"
              << "                  [--report-dir DIR] [--shell EXE]\n"
              << "                  [--model-timeout S] [--exec-timeout S]\n"
              << "                  [--dry-run] [--debug] [--show-prompts]\n"
              << "       remedy_cli --rollback [ID] [--config FILE] [--shell EXE]\n";
}

int parsePositive(const std::string& flag, const std::string& value) {
    int v = 0;
    try {
        v = std::stoi(value);
    } catch (const std::logic_error&) {
        v = 0;
    }
    if (v <= 0) {
        throw remedy::ConfigError(flag + " expects a positive number, got '" + value + "'");
    }
    return v;
}

bool askYesNo(const std::string& question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

#ifdef _WIN32
bool isElevated() {
    bool elevated = false;
    HANDLE token = nullptr;
    if (OpenProcessToken(GetCurrentProcess(), TOKEN_QUERY, &token)) {
        TOKEN_ELEVATION elevation{};
        DWORD size = sizeof(elevation);
        if (GetTokenInformation(token, TokenElevation, &elevation, sizeof(elevation), &size)) {
            elevated = elevation.TokenIsElevated != 0;
        }
        CloseHandle(token);
    }
    return elevated;
}
#endif

} // namespace

int main(int argc, char** argv) {
    remedy::ConfigOverrides overrides;
    std::string problem;
    std::string telemetryPath;
    bool dryRun = false;
    bool rollback = false;
    std::string rollbackId;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw remedy::ConfigError(arg + " expects a value");
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") { printUsage(); return 0; }
            else if (arg == "--problem") problem = next();
            else if (arg == "--telemetry") telemetryPath = next();
            else if (arg == "--config") overrides.configFile = next();
            else if (arg == "--base-url") overrides.baseUrl = next();
            else if (arg == "--model") overrides.modelId = next();
            else if (arg == "--api-key") overrides.apiKey = next();
            else if (arg == "--require-api-key") overrides.requireApiKey = true;
            else if (arg == "--scan-depth") overrides.scanDepth = next();
            else if (arg == "--restore-point-policy") overrides.restorePointPolicy = next();
            else if (arg == "--report-dir") overrides.reportDir = next();
            else if (arg == "--shell") overrides.shellExecutable = next();
            else if (arg == "--model-timeout") overrides.modelTimeoutSeconds = parsePositive(arg, next());
            else if (arg == "--exec-timeout") overrides.executionTimeoutSeconds = parsePositive(arg, next());
            else if (arg == "--dry-run") dryRun = true;
            else if (arg == "--rollback") {
                rollback = true;
                if (i + 1 < argc && argv[i + 1][0] != '-') rollbackId = argv[++i];
            }
            else if (arg == "--debug") overrides.debug = true;
            else if (arg == "--show-prompts") overrides.showPrompts = true;
            else throw remedy::ConfigError("Unknown option: " + arg);
        }

        remedy::ConfigResolver resolver;
        resolver.setKeyPrompt([]() {
            std::cout << "API key: " << std::flush;
            std::string key;
            std::getline(std::cin, key);
            return key;
        });
        remedy::ResolvedConfig resolved = resolver.resolve(overrides);

        remedy::DiagnosticPipeline pipeline(resolved.config);
        auto& console = pipeline.console();
        for (const auto& note : resolved.notes) {
            console.printWarning(note);
        }
        if (resolved.config.debug) {
            for (const auto& [key, source] : resolved.sources) {
                std::cerr << "[CONFIG] " << key << " from " << remedy::configSourceToString(source) << std::endl;
            }
        }

        if (rollback) {
            if (!askYesNo("Restore the system now? Windows will restart.")) return 0;
            return pipeline.rollback(rollbackId).initiated ? 0 : 2;
        }

#ifdef _WIN32
        if (!isElevated()) {
            console.printWarning("Not running as administrator; the remediation script will refuse to run.");
        }
#endif

        if (problem.empty()) {
            std::cout << "Describe the problem: " << std::flush;
            std::getline(std::cin, problem);
        }

        remedy::TelemetrySnapshot snapshot;
        if (!telemetryPath.empty()) {
            snapshot = remedy::loadTelemetryFile(telemetryPath);
        } else {
            console.printWarning("No telemetry file given; diagnosing from the problem description only.");
        }

        pipeline.setConfirmationHandler(
            [dryRun](const remedy::SanitizedScript&, const remedy::SafetyReport&,
                     const remedy::ImpactPreview&) {
                if (dryRun) return false;
                return askYesNo("Run this remediation script now?");
            });

        remedy::DiagnosticRun run = pipeline.run(snapshot, problem);

        try {
            console.printReportPath(pipeline.writeReport(run));
            std::string logPath = pipeline.writeExecutionLog(run);
            if (!logPath.empty()) console.printInfo("Execution log saved: " + logPath);
        } catch (const std::exception& e) {
            console.printError(std::string("Report not saved: ") + e.what());
        }

        return run.status == remedy::RemediationStatus::FAILED ? 2 : 0;
    } catch (const remedy::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        printUsage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
