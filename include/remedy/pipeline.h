// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// The diagnosis-to-remediation pipeline:
//
//   telemetry + problem -> PromptBuilder -> model -> ResponseParser
//     -> ScriptSanitizer -> SafetyValidator -> confirmation -> ExecutionController
//     -> ReportSanitizer -> VerificationReporter
//
// Each run() builds fresh instances of every intermediate value; nothing carries
// over between runs.

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "remedy/config.h"
#include "remedy/console.h"
#include "remedy/execution_controller.h"
#include "remedy/export.h"
#include "remedy/impact_preview.h"
#include "remedy/model_client.h"
#include "remedy/process_runner.h"
#include "remedy/types.h"
#include "remedy/verification_reporter.h"

namespace remedy {

/// Asked once per run, only for scripts that passed validation.
/// Returning false ends the run without executing anything.
using ConfirmationHandler =
    std::function<bool(const SanitizedScript&, const SafetyReport&, const ImpactPreview&)>;

/// Everything produced by one run.
struct DiagnosticRun {
    std::string problem;
    ModelRequest request;
    ModelResponse response;
    ParsedDiagnosis diagnosis;
    std::optional<SanitizedScript> script;
    std::optional<SafetyReport> safety;
    std::optional<ImpactPreview> impact;
    std::optional<ExecutionResult> execution;
    RemediationStatus status = RemediationStatus::NOT_OFFERED;
    std::vector<RunIssue> issues;
    std::string reportHtml;

    bool hasIssue(ErrorKind kind) const;
};

class REMEDY_API DiagnosticPipeline {
public:
    /// Real HTTP transport, child processes and Checkpoint-Computer restore points.
    explicit DiagnosticPipeline(const RemedyConfig& config);

    /// Injected collaborators (tests, alternative transports).
    DiagnosticPipeline(const RemedyConfig& config,
                       std::unique_ptr<ModelTransport> transport,
                       std::unique_ptr<ProcessRunner> runner,
                       std::unique_ptr<RestorePointProvider> restorePoints);

    ~DiagnosticPipeline();

    // Non-copyable
    DiagnosticPipeline(const DiagnosticPipeline&) = delete;
    DiagnosticPipeline& operator=(const DiagnosticPipeline&) = delete;

    /// Run the full pipeline once. Recoverable conditions are recorded in
    /// DiagnosticRun::issues; ConfigError and ExecutionInProgress propagate.
    DiagnosticRun run(const TelemetrySnapshot& snapshot, const std::string& problem);

    /// Write run.reportHtml into the configured report directory and return its path.
    /// Throws std::runtime_error if the file cannot be written.
    std::string writeReport(const DiagnosticRun& run) const;

    /// Write the script, its full output and timestamps next to the report.
    /// Returns the log path, or "" when nothing was executed.
    /// Throws std::runtime_error if the file cannot be written.
    std::string writeExecutionLog(const DiagnosticRun& run) const;

    /// Restore the system to restore point id, or to the newest one this tool
    /// created when id is empty. Throws ExecutionInProgress while a script runs.
    RestoreOutcome rollback(const std::string& id = "");

    void setOutputHandler(std::unique_ptr<OutputHandler> handler);
    void setConfirmationHandler(ConfirmationHandler handler) { confirm_ = std::move(handler); }

    OutputHandler& console() { return *console_; }
    const RemedyConfig& config() const { return config_; }

private:
    /// Model call with the single malformed-input recovery path: any transport
    /// failure becomes an empty response.
    ModelResponse requestDiagnosis(const ModelRequest& request, DiagnosticRun& run);

    void remediate(DiagnosticRun& run);
    ExecutionConfig executionConfig() const;
    std::filesystem::path outputPath(const std::string& prefix, const std::string& extension) const;
    VerificationInput buildReportInput(const TelemetrySnapshot& snapshot, const DiagnosticRun& run) const;
    void recordIssue(DiagnosticRun& run, ErrorKind kind, const std::string& message);

    RemedyConfig config_;
    std::unique_ptr<ModelTransport> transport_;
    std::unique_ptr<ProcessRunner> runner_;
    std::unique_ptr<RestorePointProvider> restorePoints_;
    std::unique_ptr<OutputHandler> console_;
    ConfirmationHandler confirm_;
};

} // namespace remedy
