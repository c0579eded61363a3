// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <remedy/verification_reporter.h>

using namespace remedy;

namespace {

VerificationInput baseInput() {
    VerificationInput input;
    input.problem = ReportSanitizer::escapeUserText("Fan is loud & CPU is hot");
    input.analysis = ReportSanitizer::sanitizeModelText(
        "<p>esrv_svc uses 90% CPU</p><ul><li>[DISABLED] esrv_svc</li><li>[CLEANED] temp</li></ul>");
    input.generatedAt = ReportSanitizer::escapeUserText("2026-01-01T10:00:00");
    return input;
}

} // namespace

TEST(VerificationReporterTest, SuccessfulRunMarksItemsDone) {
    auto input = baseInput();
    input.status = RemediationStatus::SUCCEEDED;
    input.exitCode = 0;
    input.restorePoint = ReportSanitizer::escapeUserText("created (#42)");

    std::string html = VerificationReporter::render(input);
    EXPECT_EQ(html.rfind("<!DOCTYPE html>", 0), 0u);
    EXPECT_NE(html.find("Fan is loud &amp; CPU is hot"), std::string::npos);
    EXPECT_NE(html.find("<span class=\"done\">[DISABLED]</span>"), std::string::npos);
    EXPECT_NE(html.find("<span class=\"done\">[CLEANED]</span>"), std::string::npos);
    EXPECT_EQ(html.find("PENDING"), std::string::npos);
    EXPECT_NE(html.find("Remediation completed"), std::string::npos);
    EXPECT_NE(html.find("Exit code: 0"), std::string::npos);
    EXPECT_NE(html.find("created (#42)"), std::string::npos);
}

TEST(VerificationReporterTest, FailedRunMarksItemsPending) {
    auto input = baseInput();
    input.status = RemediationStatus::FAILED;
    input.exitCode = 1;
    input.stderrText = ReportSanitizer::escapeUserText("Access is denied.");

    std::string html = VerificationReporter::render(input);
    EXPECT_EQ(html.find("[DISABLED]"), std::string::npos);
    EXPECT_NE(html.find("[PENDING: manual attention]"), std::string::npos);
    EXPECT_NE(html.find("manual attention required"), std::string::npos);
    EXPECT_NE(html.find("Script errors"), std::string::npos);
    EXPECT_NE(html.find("Access is denied."), std::string::npos);
}

TEST(VerificationReporterTest, DeclinedRunNeverClaimsFixes) {
    std::string marked = VerificationReporter::markRemediationItems(
        "<li>[FIXED] a</li><li>[FIXED] b</li>", RemediationStatus::DECLINED);
    EXPECT_EQ(marked.find("[FIXED]"), std::string::npos);
    EXPECT_EQ(marked,
              "<li><span class=\"pending\">[PENDING: manual attention]</span> a</li>"
              "<li><span class=\"pending\">[PENDING: manual attention]</span> b</li>");
}

TEST(VerificationReporterTest, MissingAnalysisStillRendersTelemetry) {
    VerificationInput input;
    input.problem = ReportSanitizer::escapeUserText("slow");
    input.status = RemediationStatus::NOT_OFFERED;
    input.telemetry.push_back({ReportSanitizer::escapeUserText("performance"),
                               ReportSanitizer::escapeUserText("{\"cpu_percent\": 97}")});

    std::string html = VerificationReporter::render(input);
    EXPECT_NE(html.find("No AI analysis available"), std::string::npos);
    EXPECT_NE(html.find("<h3>performance</h3>"), std::string::npos);
    EXPECT_NE(html.find("&quot;cpu_percent&quot;: 97"), std::string::npos);
    EXPECT_EQ(html.find("Exit code"), std::string::npos);
}

TEST(VerificationReporterTest, BlockedRunListsViolations) {
    auto input = baseInput();
    input.status = RemediationStatus::BLOCKED;
    input.violations.push_back(ReportSanitizer::escapeUserText("line 3: <Restart-Computer> forbidden"));
    input.script = ReportSanitizer::escapeUserText("Restart-Computer");

    std::string html = VerificationReporter::render(input);
    EXPECT_NE(html.find("<li>line 3: &lt;Restart-Computer&gt; forbidden</li>"), std::string::npos);
    EXPECT_NE(html.find("<pre>Restart-Computer</pre>"), std::string::npos);
    EXPECT_NE(html.find("blocked by safety checks"), std::string::npos);
}

TEST(VerificationReporterTest, HostileProblemTextIsInert) {
    VerificationInput input;
    input.problem = ReportSanitizer::escapeUserText("<script>alert(1)</script>");
    std::string html = VerificationReporter::render(input);
    EXPECT_EQ(html.find("<script"), std::string::npos);
    EXPECT_NE(html.find("&lt;script&gt;alert(1)&lt;/script&gt;"), std::string::npos);
}

TEST(VerificationReporterTest, StatusLabels) {
    EXPECT_EQ(VerificationReporter::statusLabel(RemediationStatus::DECLINED), "Remediation declined by user");
    EXPECT_EQ(VerificationReporter::statusLabel(RemediationStatus::NOT_OFFERED),
              "No automatic remediation available");
}
