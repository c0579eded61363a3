// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Pure text transform applied to a model-generated PowerShell script before validation.

#pragma once

#include <regex>
#include <string>
#include <vector>

#include "remedy/export.h"
#include "remedy/types.h"

namespace remedy {

/// One entry of the rewrite table.
/// pattern is an ECMAScript regex; capture group 1 is compared (case-insensitively)
/// against exceptions, and a match whose group is listed is left untouched.
/// replacement uses std::regex format syntax ($1, $$).
struct RewriteRule {
    std::string name;
    std::string pattern;
    std::string replacement;
    std::vector<std::string> exceptions;
};

class REMEDY_API ScriptSanitizer {
public:
    /// Sanitizer with defaultRules().
    ScriptSanitizer();
    explicit ScriptSanitizer(std::vector<RewriteRule> rules);

    /// Append a rule to the table. Throws std::regex_error on a bad pattern.
    void addRule(RewriteRule rule);

    /// Normalise, apply the rewrite table, then prepend the elevation guard
    /// (after a leading param() block, which must remain the first statement).
    /// Deterministic and idempotent. Whitespace-only input yields an empty script.
    SanitizedScript sanitize(const std::string& rawScript) const;

    const std::vector<RewriteRule>& rules() const { return rules_; }

    static std::vector<RewriteRule> defaultRules();

    /// Marker comment + guard block, as injected.
    static const std::string& elevationGuard();

    /// The executable part of the guard (without the marker comment).
    static const std::string& elevationGuardBody();

private:
    struct CompiledRule {
        RewriteRule rule;
        std::regex regex;
    };

    std::string applyRule(const CompiledRule& compiled, const std::string& text,
                          std::vector<AppliedRewrite>& applied) const;

    std::vector<RewriteRule> rules_;
    std::vector<CompiledRule> compiled_;
};

} // namespace remedy
