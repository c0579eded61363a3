// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Static structural checks over a sanitized remediation script.

#pragma once

#include <string>
#include <vector>

#include "remedy/config.h"
#include "remedy/export.h"
#include "remedy/script_text.h"
#include "remedy/types.h"

namespace remedy {

struct ValidatorConfig {
    /// Roots under which recursive or wildcard deletes are allowed.
    std::vector<std::string> ephemeralPaths = defaultEphemeralPaths();
};

/// Rule table, evaluated in order:
///   elevation_guard          guard present and first executable statement
///   service_existence_check  stop/disable/restart preceded by Get-Service for that name
///   destructive_path         recursive/wildcard deletes only under ephemeral roots; no formats
///   error_suppression        best-effort commands carry -ErrorAction SilentlyContinue,
///                            critical commands do not
///   forbidden_command        reboot, disk init, dynamic code, encoded or downloaded payloads
///
/// Never executes the script. passed == violations.empty().
class REMEDY_API SafetyValidator {
public:
    SafetyValidator();
    explicit SafetyValidator(ValidatorConfig config);

    SafetyReport validate(const SanitizedScript& script) const;
    SafetyReport validate(const std::string& scriptText) const;

    /// True if path lies under one of the configured ephemeral roots.
    bool isEphemeralPath(const std::string& path) const;

    /// Lowercase, backslash-separated form with quotes and env-variable wrappers removed.
    static std::string normalizePath(const std::string& path);

    struct RuleInfo {
        SafetyRule id;
        std::string description;
    };
    std::vector<RuleInfo> rules() const;

private:
    struct ScriptView {
        std::string text;
        std::vector<ScriptLine> lines;
    };

    using RuleFn = void (SafetyValidator::*)(const ScriptView&, std::vector<SafetyViolation>&) const;

    struct Rule {
        SafetyRule id;
        std::string description;
        RuleFn check;
    };

    void checkElevationGuard(const ScriptView& view, std::vector<SafetyViolation>& out) const;
    void checkServiceExistence(const ScriptView& view, std::vector<SafetyViolation>& out) const;
    void checkDestructivePaths(const ScriptView& view, std::vector<SafetyViolation>& out) const;
    void checkErrorSuppression(const ScriptView& view, std::vector<SafetyViolation>& out) const;
    void checkForbiddenCommands(const ScriptView& view, std::vector<SafetyViolation>& out) const;

    ValidatorConfig config_;
    std::vector<std::string> normalizedRoots_;
    std::vector<Rule> rules_;
};

} // namespace remedy
