// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <remedy/script_sanitizer.h>

#include <regex>

using namespace remedy;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// ---- Normalisation ----

TEST(ScriptSanitizerTest, WhitespaceOnlyInputIsEmpty) {
    ScriptSanitizer sanitizer;
    auto result = sanitizer.sanitize(" \r\n\t \n");
    EXPECT_TRUE(result.empty());
    EXPECT_FALSE(result.guardInjected);
    EXPECT_TRUE(result.rewrites.empty());
}

TEST(ScriptSanitizerTest, FenceOnlyInputIsEmpty) {
    ScriptSanitizer sanitizer;
    EXPECT_TRUE(sanitizer.sanitize("```powershell\n```\n").empty());
}

TEST(ScriptSanitizerTest, StripsMarkdownFencesAndCarriageReturns) {
    ScriptSanitizer sanitizer;
    auto result = sanitizer.sanitize("```powershell\r\nWrite-Host 'one'\r\nWrite-Host 'two'\r\n```\r\n");

    EXPECT_FALSE(contains(result.text, "```"));
    EXPECT_FALSE(contains(result.text, "\r"));
    EXPECT_TRUE(contains(result.text, "Write-Host 'one'\nWrite-Host 'two'\n"));
}

TEST(ScriptSanitizerTest, OutputEndsWithSingleNewline) {
    ScriptSanitizer sanitizer;
    auto result = sanitizer.sanitize("Write-Host 'done'\n\n\n");
    ASSERT_FALSE(result.text.empty());
    EXPECT_EQ(result.text.back(), '\n');
    EXPECT_NE(result.text.substr(result.text.size() - 2), "\n\n");
}

// ---- Elevation guard ----

TEST(ScriptSanitizerTest, PrependsElevationGuard) {
    ScriptSanitizer sanitizer;
    auto result = sanitizer.sanitize("Write-Host 'hello'");

    EXPECT_TRUE(result.guardInjected);
    EXPECT_EQ(result.text.find(ScriptSanitizer::elevationGuard()), 0u);
    EXPECT_EQ(result.text, ScriptSanitizer::elevationGuard() + "\n\nWrite-Host 'hello'\n");
    EXPECT_TRUE(contains(result.text, "IsInRole"));
    EXPECT_TRUE(contains(result.text, "exit 1"));
}

TEST(ScriptSanitizerTest, GuardNotDuplicated) {
    ScriptSanitizer sanitizer;
    std::string already = ScriptSanitizer::elevationGuard() + "\n\nWrite-Host 'hello'\n";
    auto result = sanitizer.sanitize(already);
    EXPECT_FALSE(result.guardInjected);
    EXPECT_EQ(result.text, already);
}

TEST(ScriptSanitizerTest, GuardFollowsParamBlock) {
    ScriptSanitizer sanitizer;
    std::string header =
        "[CmdletBinding()]\n"
        "param(\n"
        "    [string]$ServiceName = 'esrv_svc',  # the ) here is a comment\n"
        "    [string]$Note = \"a ) b\"\n"
        ")";
    auto result = sanitizer.sanitize(header + "\nStop-Service $ServiceName");

    EXPECT_TRUE(result.guardInjected);
    EXPECT_EQ(result.text,
              header + "\n\n" + ScriptSanitizer::elevationGuard() + "\n\nStop-Service $ServiceName\n");
    EXPECT_EQ(sanitizer.sanitize(result.text).text, result.text);
}

TEST(ScriptSanitizerTest, ParamOnlyScriptStillGetsGuard) {
    ScriptSanitizer sanitizer;
    auto result = sanitizer.sanitize("param($x)");
    EXPECT_EQ(result.text, "param($x)\n\n" + ScriptSanitizer::elevationGuard() + "\n");
}

// ---- Rewrite table ----

TEST(ScriptSanitizerTest, RewritesDriveQualifiedVariables) {
    ScriptSanitizer sanitizer;
    auto result = sanitizer.sanitize("Write-Host \"Stopping $svc: done\"");

    EXPECT_TRUE(contains(result.text, "Stopping $($svc): done"));
    ASSERT_EQ(result.rewrites.size(), 1u);
    EXPECT_EQ(result.rewrites[0].rule, "drive_qualified_variable");
    EXPECT_EQ(result.rewrites[0].original, "$svc:");
    EXPECT_EQ(result.rewrites[0].replacement, "$($svc):");
    EXPECT_EQ(result.rewrites[0].line, 1u);
}

TEST(ScriptSanitizerTest, KeepsScopeAndProviderQualifiers) {
    ScriptSanitizer sanitizer;
    std::string body =
        "Remove-Item \"$env:TEMP\\*\" -Recurse -Force -ErrorAction SilentlyContinue\n"
        "$script:count = 1\n"
        "$global:done = $true\n"
        "$ENV:windir\n"
        "[int]::MaxValue";
    auto result = sanitizer.sanitize(body);

    EXPECT_TRUE(result.rewrites.empty());
    EXPECT_TRUE(contains(result.text, body));
}

TEST(ScriptSanitizerTest, StaticMemberAccessUntouched) {
    ScriptSanitizer sanitizer;
    auto result = sanitizer.sanitize("$x::Now");
    EXPECT_TRUE(result.rewrites.empty());
    EXPECT_TRUE(contains(result.text, "$x::Now"));
}

TEST(ScriptSanitizerTest, RewriteLinesCountFromBodyStart) {
    ScriptSanitizer sanitizer;
    auto result = sanitizer.sanitize("Write-Host 'a'\nWrite-Host \"$name: b\"\nWrite-Host \"$other: c\"");
    ASSERT_EQ(result.rewrites.size(), 2u);
    EXPECT_EQ(result.rewrites[0].line, 2u);
    EXPECT_EQ(result.rewrites[1].line, 3u);
}

TEST(ScriptSanitizerTest, IsIdempotent) {
    ScriptSanitizer sanitizer;
    std::string raw =
        "```powershell\r\n"
        "$svc = Get-Service -Name 'esrv_svc' -ErrorAction SilentlyContinue\r\n"
        "Write-Host \"Service $svc: $env:COMPUTERNAME\"\r\n"
        "```";
    auto once = sanitizer.sanitize(raw);
    auto twice = sanitizer.sanitize(once.text);

    EXPECT_EQ(once.text, twice.text);
    EXPECT_TRUE(twice.rewrites.empty());
    EXPECT_FALSE(twice.guardInjected);
}

TEST(ScriptSanitizerTest, CustomRuleTable) {
    ScriptSanitizer sanitizer(std::vector<RewriteRule>{});
    EXPECT_TRUE(sanitizer.rules().empty());

    sanitizer.addRule({"smart_quotes", "(\xE2\x80\x9C|\xE2\x80\x9D)", "\"", {}});
    auto result = sanitizer.sanitize("Write-Host \xE2\x80\x9Chi\xE2\x80\x9D");
    EXPECT_TRUE(contains(result.text, "Write-Host \"hi\""));
    EXPECT_EQ(result.rewrites.size(), 2u);
}

TEST(ScriptSanitizerTest, BadRulePatternThrows) {
    ScriptSanitizer sanitizer(std::vector<RewriteRule>{});
    EXPECT_THROW(sanitizer.addRule({"broken", "(unclosed", "", {}}), std::regex_error);
}

TEST(ScriptSanitizerTest, DefaultRulesListed) {
    auto rules = ScriptSanitizer::defaultRules();
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0].name, "drive_qualified_variable");
}
