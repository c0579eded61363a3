// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/pipeline.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "remedy/errors.h"
#include "remedy/prompt_builder.h"
#include "remedy/report_sanitizer.h"
#include "remedy/response_parser.h"
#include "remedy/safety_validator.h"
#include "remedy/script_sanitizer.h"

namespace remedy {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    out << content;
    out.close();
    if (!out) {
        throw std::runtime_error("Cannot write " + path.string());
    }
}

std::unique_ptr<OutputHandler> defaultConsole(const RemedyConfig& config) {
    if (config.silentMode) return std::make_unique<SilentConsole>();
    return std::make_unique<TerminalConsole>();
}

} // namespace

bool DiagnosticRun::hasIssue(ErrorKind kind) const {
    return std::any_of(issues.begin(), issues.end(),
                       [kind](const RunIssue& issue) { return issue.kind == kind; });
}

// ---- Construction ----

DiagnosticPipeline::DiagnosticPipeline(const RemedyConfig& config)
    : config_(config),
      transport_(std::make_unique<HttpModelClient>(ModelClientConfig::fromConfig(config))),
      runner_(std::make_unique<SubprocessRunner>()),
      console_(defaultConsole(config)) {
    restorePoints_ = std::make_unique<PowerShellRestorePoint>(
        *runner_, config_.shellExecutable, config_.restorePointTimeoutSeconds);
}

DiagnosticPipeline::DiagnosticPipeline(const RemedyConfig& config,
                                       std::unique_ptr<ModelTransport> transport,
                                       std::unique_ptr<ProcessRunner> runner,
                                       std::unique_ptr<RestorePointProvider> restorePoints)
    : config_(config),
      transport_(std::move(transport)),
      runner_(std::move(runner)),
      restorePoints_(std::move(restorePoints)),
      console_(defaultConsole(config)) {
    if (!transport_ || !runner_ || !restorePoints_) {
        throw std::invalid_argument("DiagnosticPipeline requires a transport, a runner and a restore point provider");
    }
}

DiagnosticPipeline::~DiagnosticPipeline() = default;

void DiagnosticPipeline::setOutputHandler(std::unique_ptr<OutputHandler> handler) {
    if (handler) console_ = std::move(handler);
}

void DiagnosticPipeline::recordIssue(DiagnosticRun& run, ErrorKind kind, const std::string& message) {
    run.issues.push_back({kind, message});
    console_->printWarning(errorKindToString(kind) + ": " + message);
}

// ---- Run ----

DiagnosticRun DiagnosticPipeline::run(const TelemetrySnapshot& snapshot, const std::string& problem) {
    DiagnosticRun run;
    run.problem = problem;

    std::string depth = config_.categories.empty() ? scanDepthToString(config_.scanDepth) : "custom";
    console_->printRunStart(problem, depth, config_.modelId);

    PromptBuilder builder(PromptConfig{config_.effectiveCategories(), config_.maxFieldChars});
    run.request = builder.build(snapshot, problem);
    if (config_.showPrompts) {
        console_->printPrompt(run.request.text, "Model request");
    }

    console_->printStage("Analysis");
    run.response = requestDiagnosis(run.request, run);
    if (config_.showPrompts) {
        console_->printResponse(run.response.text, "Model response");
    }

    run.diagnosis = ResponseParser::parse(run.response.text);
    if (!run.diagnosis.wellFormed) {
        recordIssue(run, ErrorKind::UPSTREAM_MALFORMED,
                    "model output is missing a complete analysis or fix section (parser stopped in " +
                    parseStateToString(run.diagnosis.finalState) + ")");
    }
    console_->printAnalysis(trim(run.diagnosis.analysisText));

    remediate(run);

    run.reportHtml = VerificationReporter::render(buildReportInput(snapshot, run));
    return run;
}

ModelResponse DiagnosticPipeline::requestDiagnosis(const ModelRequest& request, DiagnosticRun& run) {
    ModelResponse response;
    console_->startProgress("Waiting for the model");
    try {
        response.text = transport_->complete(request);
        console_->stopProgress();
    } catch (const TransportError& e) {
        console_->stopProgress();
        recordIssue(run, ErrorKind::TRANSPORT_FAILURE, e.what());
    }
    return response;
}

void DiagnosticPipeline::remediate(DiagnosticRun& run) {
    if (trim(run.diagnosis.rawScript).empty()) {
        run.status = RemediationStatus::NOT_OFFERED;
        console_->printInfo("No automatic remediation available.");
        return;
    }

    console_->printStage("Safety checks");
    ScriptSanitizer sanitizer;
    run.script = sanitizer.sanitize(run.diagnosis.rawScript);

    SafetyValidator validator(ValidatorConfig{config_.ephemeralPaths});
    run.safety = validator.validate(*run.script);
    run.impact = previewImpact(run.script->text);

    console_->printScript(*run.script);
    console_->printSafetyReport(*run.safety);

    if (!run.safety->passed) {
        run.status = RemediationStatus::BLOCKED;
        recordIssue(run, ErrorKind::SAFETY_VIOLATION,
                    std::to_string(run.safety->violations.size()) +
                    " violation(s); the script was not executed");
        return;
    }

    console_->printImpactPreview(*run.impact);
    if (!confirm_ || !confirm_(*run.script, *run.safety, *run.impact)) {
        run.status = RemediationStatus::DECLINED;
        console_->printInfo("Remediation declined; nothing was run.");
        return;
    }

    console_->printStage("Remediation");
    ExecutionController controller(*runner_, *restorePoints_, executionConfig());
    console_->startProgress("Running remediation script");
    run.execution = controller.execute(*run.script, *run.safety);
    console_->stopProgress();

    if (run.execution->restorePointError) {
        console_->printWarning("Restore point unavailable: " + *run.execution->restorePointError);
    }
    console_->printExecutionResult(*run.execution);

    if (run.execution->succeeded()) {
        run.status = RemediationStatus::SUCCEEDED;
    } else {
        run.status = RemediationStatus::FAILED;
        std::string what = !run.execution->launched ? "script did not start"
                         : run.execution->timedOut ? "script timed out"
                         : "script exited with code " + std::to_string(run.execution->exitCode) +
                           (trim(run.execution->stderrText).empty() ? "" : " and reported errors");
        recordIssue(run, ErrorKind::EXECUTION_FAILURE, what);
    }
}

ExecutionConfig DiagnosticPipeline::executionConfig() const {
    ExecutionConfig execConfig;
    execConfig.shellExecutable = config_.shellExecutable;
    execConfig.timeoutSeconds = config_.executionTimeoutSeconds;
    execConfig.restorePointPolicy = config_.restorePointPolicy;
    return execConfig;
}

RestoreOutcome DiagnosticPipeline::rollback(const std::string& id) {
    ExecutionController controller(*runner_, *restorePoints_, executionConfig());
    console_->startProgress("Restoring the system");
    RestoreOutcome outcome = controller.rollback(id);
    console_->stopProgress();

    if (outcome.initiated) {
        console_->printInfo(outcome.message);
    } else {
        console_->printError("Rollback failed: " + outcome.message);
    }
    return outcome;
}

// ---- Report ----

VerificationInput DiagnosticPipeline::buildReportInput(const TelemetrySnapshot& snapshot,
                                                       const DiagnosticRun& run) const {
    VerificationInput input;
    input.generatedAt = ReportSanitizer::escapeUserText(formatTimestamp(std::chrono::system_clock::now()));
    input.problem = ReportSanitizer::escapeUserText(run.problem);

    std::string analysis = trim(run.diagnosis.analysisText);
    if (!analysis.empty()) {
        input.analysis = ReportSanitizer::sanitizeModelText(analysis);
    }

    input.status = run.status;
    if (run.script) {
        input.script = ReportSanitizer::escapeUserText(run.script->text);
    }
    if (run.safety) {
        for (const auto& v : run.safety->violations) {
            std::string line = "[" + safetyRuleToString(v.rule) + "] ";
            if (v.lineNumber > 0) line += "line " + std::to_string(v.lineNumber) + ": ";
            input.violations.push_back(ReportSanitizer::escapeUserText(line + v.detail));
        }
    }
    if (run.execution) {
        const ExecutionResult& ex = *run.execution;
        if (ex.launched) input.exitCode = ex.exitCode;
        input.stdoutText = ReportSanitizer::escapeUserText(ex.stdoutText);
        input.stderrText = ReportSanitizer::escapeUserText(ex.stderrText);
        if (ex.restorePointId) {
            input.restorePoint = ReportSanitizer::escapeUserText(*ex.restorePointId);
        } else if (ex.restorePointError) {
            input.restorePoint = ReportSanitizer::escapeUserText("not created (" + *ex.restorePointError + ")");
        }
    }
    for (const auto& issue : run.issues) {
        input.notes.push_back(ReportSanitizer::escapeUserText(errorKindToString(issue.kind) + ": " + issue.message));
    }

    for (const auto& name : config_.effectiveCategories()) {
        if (!snapshot.hasCategory(name)) continue;
        TelemetryPanel panel;
        panel.title = ReportSanitizer::escapeUserText(name);
        panel.body = ReportSanitizer::escapeUserText(
            snapshot.category(name).dump(2, ' ', false, json::error_handler_t::replace));
        input.telemetry.push_back(std::move(panel));
    }
    return input;
}

std::string DiagnosticPipeline::writeReport(const DiagnosticRun& run) const {
    fs::path path = outputPath("diagnostic_report_", ".html");
    writeFile(path, run.reportHtml);
    return path.string();
}

std::string DiagnosticPipeline::writeExecutionLog(const DiagnosticRun& run) const {
    if (!run.execution || !run.script) return "";
    fs::path path = outputPath("execution_", ".log");
    writeFile(path, formatExecutionLog(*run.script, *run.execution));
    return path.string();
}

fs::path DiagnosticPipeline::outputPath(const std::string& prefix, const std::string& extension) const {
    std::error_code ec;
    fs::create_directories(config_.reportDir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create report directory " + config_.reportDir + ": " + ec.message());
    }

    std::string stamp = formatTimestamp(std::chrono::system_clock::now());
    stamp.erase(std::remove(stamp.begin(), stamp.end(), ':'), stamp.end());
    stamp.erase(std::remove(stamp.begin(), stamp.end(), '-'), stamp.end());
    std::replace(stamp.begin(), stamp.end(), 'T', '_');
    return fs::path(config_.reportDir) / (prefix + stamp + extension);
}

} // namespace remedy
