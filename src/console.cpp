// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/console.h"

#include <iostream>

namespace remedy {

namespace {

std::string truncateForDisplay(const std::string& text, size_t limit) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit / 2) + "\n...[truncated]...\n" + text.substr(text.size() - limit / 4);
}

} // namespace

// ---- TerminalConsole ----

void TerminalConsole::printRunStart(const std::string& problem, const std::string& scanDepth,
                                    const std::string& modelId) {
    std::cout << "\n" << BOLD << CYAN << "Diagnosing" << RESET << ": " << problem << "\n";
    std::cout << DIM << "Scan depth: " << scanDepth;
    if (!modelId.empty()) {
        std::cout << " | Model: " << modelId;
    }
    std::cout << RESET << "\n\n";
}

void TerminalConsole::printStage(const std::string& stage) {
    std::cout << BOLD << BLUE << "--- " << stage << " ---" << RESET << "\n";
}

void TerminalConsole::printAnalysis(const std::string& analysis) {
    if (analysis.empty()) {
        std::cout << YELLOW << "No AI analysis available." << RESET << "\n";
        return;
    }
    std::cout << BOLD << "Analysis:" << RESET << "\n" << truncateForDisplay(analysis, 4000) << "\n";
}

void TerminalConsole::printScript(const SanitizedScript& script) {
    std::cout << BOLD << "Remediation script" << RESET;
    if (script.guardInjected || !script.rewrites.empty()) {
        std::cout << DIM << " (elevation guard " << (script.guardInjected ? "added" : "present")
                  << ", " << script.rewrites.size() << " rewrite(s))" << RESET;
    }
    std::cout << ":\n";
    printSeparator();
    std::cout << script.text;
    printSeparator();
    for (const auto& rewrite : script.rewrites) {
        std::cout << DIM << "  line " << rewrite.line << ": " << rewrite.original << " -> "
                  << rewrite.replacement << RESET << "\n";
    }
}

void TerminalConsole::printSafetyReport(const SafetyReport& report) {
    if (report.passed) {
        std::cout << GREEN << "Safety checks passed." << RESET << "\n";
        return;
    }
    std::cout << RED << BOLD << "Safety checks failed (" << report.violations.size()
              << " violation(s)); the script will not be run." << RESET << "\n";
    for (const auto& v : report.violations) {
        std::cout << RED << "  [" << safetyRuleToString(v.rule) << "]" << RESET;
        if (v.lineNumber > 0) std::cout << " line " << v.lineNumber;
        std::cout << ": " << v.detail << "\n";
        if (!v.offendingLine.empty()) {
            std::cout << DIM << "      " << v.offendingLine << RESET << "\n";
        }
    }
}

void TerminalConsole::printImpactPreview(const ImpactPreview& preview) {
    const char* color = preview.riskLevel >= RiskLevel::HIGH ? RED
                      : preview.riskLevel >= RiskLevel::MEDIUM ? YELLOW : GREEN;
    std::cout << color << preview.summary() << RESET;
}

void TerminalConsole::printExecutionResult(const ExecutionResult& result) {
    if (result.restorePointId) {
        std::cout << DIM << "Restore point: " << *result.restorePointId << RESET << "\n";
    } else if (result.restorePointError) {
        std::cout << YELLOW << "WARNING: " << RESET << "restore point not created: "
                  << *result.restorePointError << "\n";
    }

    if (result.succeeded()) {
        std::cout << GREEN << BOLD << "Remediation completed (exit code 0)." << RESET << "\n";
    } else if (!result.launched) {
        std::cout << RED << BOLD << "Remediation did not start." << RESET << "\n";
    } else {
        std::cout << RED << BOLD << "Remediation finished with problems (exit code "
                  << result.exitCode << (result.timedOut ? ", timed out" : "") << ")." << RESET << "\n";
    }
    if (!result.stdoutText.empty()) {
        std::cout << DIM << "stdout:" << RESET << "\n" << truncateForDisplay(result.stdoutText, 4000) << "\n";
    }
    if (!result.stderrText.empty()) {
        std::cout << RED << "stderr:" << RESET << "\n" << truncateForDisplay(result.stderrText, 4000) << "\n";
    }
}

void TerminalConsole::printReportPath(const std::string& path) {
    std::cout << GREEN << "Report saved: " << RESET << path << "\n";
}

void TerminalConsole::printError(const std::string& message) {
    std::cout << RED << "ERROR: " << RESET << message << "\n";
}

void TerminalConsole::printWarning(const std::string& message) {
    std::cout << YELLOW << "WARNING: " << RESET << message << "\n";
}

void TerminalConsole::printInfo(const std::string& message) {
    std::cout << BLUE << "INFO: " << RESET << message << "\n";
}

void TerminalConsole::startProgress(const std::string& message) {
    std::cout << DIM << message << "..." << RESET << std::flush;
}

void TerminalConsole::stopProgress() {
    std::cout << "\n";
}

void TerminalConsole::printPrompt(const std::string& text, const std::string& title) {
    std::cout << DIM << "[" << title << "]" << RESET << "\n" << text << "\n";
}

void TerminalConsole::printResponse(const std::string& text, const std::string& title) {
    std::cout << DIM << "[" << title << "]" << RESET << "\n"
              << truncateForDisplay(text, 6000) << "\n";
}

void TerminalConsole::printSeparator(int width) {
    std::cout << std::string(static_cast<size_t>(width), '-') << "\n";
}

} // namespace remedy
