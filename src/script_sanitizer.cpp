// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/script_sanitizer.h"
#include "remedy/script_text.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace remedy {

namespace {

const std::string kGuardMarker = "# remedy: elevation guard";

const std::string kGuardBody =
    "if (-not ([Security.Principal.WindowsPrincipal][Security.Principal.WindowsIdentity]::GetCurrent()"
    ").IsInRole([Security.Principal.WindowsBuiltInRole]::Administrator)) {\n"
    "    Write-Host \"ERROR: This script requires Administrator privileges\" -ForegroundColor Red\n"
    "    exit 1\n"
    "}";

const std::string kGuard = kGuardMarker + "\n" + kGuardBody;

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

/// CRLF to LF, drop Markdown fence lines, trim.
std::string normalize(const std::string& raw) {
    std::string text;
    text.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\r') {
            if (i + 1 < raw.size() && raw[i + 1] == '\n') continue;
            text += '\n';
        } else {
            text += raw[i];
        }
    }

    std::istringstream in(text);
    std::string line;
    std::string out;
    while (std::getline(in, line)) {
        if (trim(line).rfind("```", 0) == 0) continue;
        out += line;
        out += '\n';
    }
    return trim(out);
}

size_t lineOf(const std::string& text, size_t offset) {
    return static_cast<size_t>(std::count(text.begin(), text.begin() + offset, '\n')) + 1;
}

} // namespace

ScriptSanitizer::ScriptSanitizer() : ScriptSanitizer(defaultRules()) {}

ScriptSanitizer::ScriptSanitizer(std::vector<RewriteRule> rules) {
    for (auto& rule : rules) {
        addRule(std::move(rule));
    }
}

void ScriptSanitizer::addRule(RewriteRule rule) {
    std::regex regex(rule.pattern, std::regex::ECMAScript);
    rules_.push_back(rule);
    compiled_.push_back(CompiledRule{std::move(rule), std::move(regex)});
}

std::vector<RewriteRule> ScriptSanitizer::defaultRules() {
    return {
        // "$name:" parses as a drive-qualified variable and breaks strings such as
        // "Stopping $svc: done". Scope and provider qualifiers are real syntax.
        RewriteRule{
            "drive_qualified_variable",
            R"(\$([A-Za-z_][A-Za-z0-9_]*):(?!:))",
            "$$($1):",
            {"env", "script", "global", "local", "private", "using", "variable", "function", "alias"},
        },
    };
}

const std::string& ScriptSanitizer::elevationGuard() {
    return kGuard;
}

const std::string& ScriptSanitizer::elevationGuardBody() {
    return kGuardBody;
}

std::string ScriptSanitizer::applyRule(const CompiledRule& compiled, const std::string& text,
                                       std::vector<AppliedRewrite>& applied) const {
    std::string out;
    out.reserve(text.size());
    size_t last = 0;

    for (auto it = std::sregex_iterator(text.begin(), text.end(), compiled.regex);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        size_t start = static_cast<size_t>(m.position(0));
        out.append(text, last, start - last);

        std::string captured = m.size() > 1 ? m[1].str() : std::string();
        bool excepted = std::any_of(compiled.rule.exceptions.begin(), compiled.rule.exceptions.end(),
                                    [&](const std::string& e) { return equalsIgnoreCase(e, captured); });
        if (excepted) {
            out += m.str(0);
        } else {
            std::string replacement = m.format(compiled.rule.replacement);
            applied.push_back({compiled.rule.name, m.str(0), replacement, lineOf(text, start)});
            out += replacement;
        }
        last = start + static_cast<size_t>(m.length(0));
    }
    out.append(text, last, std::string::npos);
    return out;
}

SanitizedScript ScriptSanitizer::sanitize(const std::string& rawScript) const {
    SanitizedScript result;
    std::string body = normalize(rawScript);
    if (body.empty()) {
        return result;
    }

    for (const auto& compiled : compiled_) {
        body = applyRule(compiled, body, result.rewrites);
    }

    // A param() block must stay the first statement, so the guard follows it.
    size_t headerEnd = leadingParamBlockEnd(body);
    std::string header = body.substr(0, headerEnd);
    std::string rest = trim(body.substr(headerEnd));
    if (rest.compare(0, kGuard.size(), kGuard) != 0) {
        rest = rest.empty() ? kGuard : kGuard + "\n\n" + rest;
        result.guardInjected = true;
    }
    body = header.empty() ? rest : header + "\n\n" + rest;

    result.text = body + "\n";
    return result;
}

} // namespace remedy
