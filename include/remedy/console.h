// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Console output for the diagnostic pipeline.
// TerminalConsole writes ANSI-coloured text; SilentConsole discards everything.

#pragma once

#include <string>

#include "remedy/export.h"
#include "remedy/impact_preview.h"
#include "remedy/types.h"

namespace remedy {

/// Receives every user-visible event of a diagnostic run.
/// The pipeline never writes to stdout directly; it goes through one of these.
class REMEDY_API OutputHandler {
public:
    virtual ~OutputHandler() = default;

    // ---- Run stages ----
    virtual void printRunStart(const std::string& problem, const std::string& scanDepth,
                               const std::string& modelId = "") = 0;
    virtual void printStage(const std::string& stage) = 0;

    virtual void printAnalysis(const std::string& analysis) = 0;
    virtual void printScript(const SanitizedScript& script) = 0;
    virtual void printSafetyReport(const SafetyReport& report) = 0;
    virtual void printImpactPreview(const ImpactPreview& preview) = 0;
    virtual void printExecutionResult(const ExecutionResult& result) = 0;
    virtual void printReportPath(const std::string& path) = 0;

    // ---- Status lines ----
    virtual void printError(const std::string& message) = 0;
    virtual void printWarning(const std::string& message) = 0;
    virtual void printInfo(const std::string& message) = 0;

    /// Marks a blocking step (model call, script run). Always paired with stopProgress().
    virtual void startProgress(const std::string& message) = 0;
    virtual void stopProgress() = 0;

    // ---- Debug output (--show-prompts); ignored unless overridden ----
    virtual void printPrompt(const std::string& /*text*/, const std::string& /*title*/ = "Model request") {}
    virtual void printResponse(const std::string& /*text*/, const std::string& /*title*/ = "Model response") {}
    virtual void printSeparator(int /*width*/ = 50) {}
};

/// Colour terminal output on stdout.
class REMEDY_API TerminalConsole : public OutputHandler {
public:
    void printRunStart(const std::string& problem, const std::string& scanDepth,
                       const std::string& modelId = "") override;
    void printStage(const std::string& stage) override;
    void printAnalysis(const std::string& analysis) override;
    void printScript(const SanitizedScript& script) override;
    void printSafetyReport(const SafetyReport& report) override;
    void printImpactPreview(const ImpactPreview& preview) override;
    void printExecutionResult(const ExecutionResult& result) override;
    void printReportPath(const std::string& path) override;
    void printError(const std::string& message) override;
    void printWarning(const std::string& message) override;
    void printInfo(const std::string& message) override;
    void startProgress(const std::string& message) override;
    void stopProgress() override;
    void printPrompt(const std::string& text, const std::string& title = "Model request") override;
    void printResponse(const std::string& text, const std::string& title = "Model response") override;
    void printSeparator(int width = 50) override;

private:
    // ANSI colour codes
    static constexpr const char* RESET   = "\033[0m";
    static constexpr const char* BOLD    = "\033[1m";
    static constexpr const char* DIM     = "\033[90m";
    static constexpr const char* RED     = "\033[91m";
    static constexpr const char* GREEN   = "\033[92m";
    static constexpr const char* YELLOW  = "\033[93m";
    static constexpr const char* BLUE    = "\033[94m";
    static constexpr const char* CYAN    = "\033[96m";
};

/// Discards all output. Used by tests and when only the HTML report is wanted.
class REMEDY_API SilentConsole : public OutputHandler {
public:
    void printRunStart(const std::string&, const std::string&, const std::string&) override {}
    void printStage(const std::string&) override {}
    void printAnalysis(const std::string&) override {}
    void printScript(const SanitizedScript&) override {}
    void printSafetyReport(const SafetyReport&) override {}
    void printImpactPreview(const ImpactPreview&) override {}
    void printExecutionResult(const ExecutionResult&) override {}
    void printReportPath(const std::string&) override {}
    void printError(const std::string&) override {}
    void printWarning(const std::string&) override {}
    void printInfo(const std::string&) override {}
    void startProgress(const std::string&) override {}
    void stopProgress() override {}
};

} // namespace remedy
