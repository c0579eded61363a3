// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Renders the post-run diagnostic report from sanitized fragments only.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "remedy/export.h"
#include "remedy/report_sanitizer.h"
#include "remedy/types.h"

namespace remedy {

struct TelemetryPanel {
    SanitizedReportFragment title;
    SanitizedReportFragment body;
};

struct VerificationInput {
    SanitizedReportFragment problem;
    SanitizedReportFragment analysis;    // empty: no AI analysis available
    RemediationStatus status = RemediationStatus::NOT_OFFERED;
    std::optional<int> exitCode;
    SanitizedReportFragment script;
    SanitizedReportFragment stdoutText;
    SanitizedReportFragment stderrText;
    SanitizedReportFragment restorePoint;
    std::vector<SanitizedReportFragment> violations;
    std::vector<SanitizedReportFragment> notes;
    std::vector<TelemetryPanel> telemetry;
    SanitizedReportFragment generatedAt;
};

class REMEDY_API VerificationReporter {
public:
    /// Complete standalone HTML document.
    static std::string render(const VerificationInput& input);

    /// Rewrite [FIXED]/[CLEANED]/[DISABLED] tags in the analysis: kept as done only
    /// when the remediation succeeded, otherwise marked as needing manual attention.
    static std::string markRemediationItems(const std::string& analysisHtml, RemediationStatus status);

    static std::string statusLabel(RemediationStatus status);
};

} // namespace remedy
