// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/verification_reporter.h"

#include <regex>
#include <sstream>

namespace remedy {

namespace {

const char* kStyle =
    "body{font-family:Segoe UI,Arial,sans-serif;margin:2em;color:#222}"
    "h1{font-size:1.5em}h2{font-size:1.2em;border-bottom:1px solid #ccc}"
    ".box{background:#f6f6f6;padding:1em;border-radius:4px}"
    "pre{white-space:pre-wrap;background:#f0f0f0;padding:.8em}"
    ".done{color:#1a7f37;font-weight:bold}.pending{color:#b35900;font-weight:bold}"
    ".status-ok{color:#1a7f37}.status-bad{color:#b3261e}";

void section(std::ostringstream& oss, const char* title, const std::string& body) {
    oss << "<h2>" << title << "</h2>\n" << body << "\n";
}

} // namespace

std::string VerificationReporter::statusLabel(RemediationStatus status) {
    switch (status) {
        case RemediationStatus::NOT_OFFERED: return "No automatic remediation available";
        case RemediationStatus::BLOCKED:     return "Remediation blocked by safety checks";
        case RemediationStatus::DECLINED:    return "Remediation declined by user";
        case RemediationStatus::SUCCEEDED:   return "Remediation completed";
        case RemediationStatus::FAILED:      return "Remediation failed, manual attention required";
    }
    return "Unknown";
}

std::string VerificationReporter::markRemediationItems(const std::string& analysisHtml,
                                                       RemediationStatus status) {
    static const std::regex tag(R"(\[(FIXED|CLEANED|DISABLED)\])");
    if (status == RemediationStatus::SUCCEEDED) {
        return std::regex_replace(analysisHtml, tag, "<span class=\"done\">[$1]</span>");
    }
    return std::regex_replace(analysisHtml, tag,
                              "<span class=\"pending\">[PENDING: manual attention]</span>");
}

std::string VerificationReporter::render(const VerificationInput& input) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\">"
        << "<title>Diagnostic report</title><style>" << kStyle << "</style></head>\n<body>\n";
    oss << "<h1>Diagnostic report</h1>\n";
    if (!input.generatedAt.empty()) {
        oss << "<p>Generated " << input.generatedAt.html() << "</p>\n";
    }

    section(oss, "Reported problem", "<div class=\"box\">" + input.problem.html() + "</div>");

    if (input.analysis.empty()) {
        section(oss, "Analysis", "<p>No AI analysis available. Telemetry is included below.</p>");
    } else {
        section(oss, "Analysis", "<div class=\"box\">" +
                markRemediationItems(input.analysis.html(), input.status) + "</div>");
    }

    bool ok = input.status == RemediationStatus::SUCCEEDED;
    std::string status = "<p class=\"" + std::string(ok ? "status-ok" : "status-bad") + "\">" +
                         statusLabel(input.status) + "</p>\n";
    if (input.exitCode) {
        status += "<p>Exit code: " + std::to_string(*input.exitCode) + "</p>\n";
    }
    if (!input.restorePoint.empty()) {
        status += "<p>Restore point: " + input.restorePoint.html() + "</p>\n";
    }
    if (!input.violations.empty()) {
        status += "<ul>\n";
        for (const auto& v : input.violations) status += "<li>" + v.html() + "</li>\n";
        status += "</ul>\n";
    }
    for (const auto& note : input.notes) {
        status += "<p>" + note.html() + "</p>\n";
    }
    section(oss, "Remediation", status);

    if (!input.script.empty()) {
        section(oss, "Script", "<pre>" + input.script.html() + "</pre>");
    }
    if (!input.stdoutText.empty()) {
        section(oss, "Script output", "<pre>" + input.stdoutText.html() + "</pre>");
    }
    if (!input.stderrText.empty()) {
        section(oss, "Script errors", "<pre>" + input.stderrText.html() + "</pre>");
    }

    if (!input.telemetry.empty()) {
        oss << "<h2>Telemetry</h2>\n";
        for (const auto& panel : input.telemetry) {
            oss << "<h3>" << panel.title.html() << "</h3>\n<pre>" << panel.body.html() << "</pre>\n";
        }
    }

    oss << "</body></html>\n";
    return oss.str();
}

} // namespace remedy
