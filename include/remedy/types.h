// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Core data types for the diagnosis-to-remediation pipeline.

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "remedy/export.h"

namespace remedy {

using json = nlohmann::json;

// ---- Telemetry ----

/// Immutable category -> (field -> scalar value) record of system facts.
/// Values are kept as JSON scalars (string, number, boolean).
class REMEDY_API TelemetrySnapshot {
public:
    TelemetrySnapshot() : categories_(json::object()) {}

    /// Build a snapshot from a JSON object of objects.
    /// Non-object categories are dropped; nested field values are stored as compact JSON text.
    static TelemetrySnapshot fromJson(const json& data);

    bool empty() const { return categories_.empty(); }
    bool hasCategory(const std::string& name) const { return categories_.contains(name); }

    /// Field map for a category, or an empty object if absent.
    json category(const std::string& name) const;

    std::vector<std::string> categoryNames() const;
    const json& toJson() const { return categories_; }

private:
    explicit TelemetrySnapshot(json categories) : categories_(std::move(categories)) {}

    json categories_;
};

/// Read a snapshot from a JSON file. Throws std::runtime_error if unreadable or malformed.
REMEDY_API TelemetrySnapshot loadTelemetryFile(const std::string& path);

// ---- Model exchange ----

struct ModelRequest {
    std::string text;
};

struct ModelResponse {
    std::string text;
};

// ---- Parsing ----

enum class ParseState {
    SEEKING_ANALYSIS,
    IN_ANALYSIS,
    SEEKING_FIX,
    IN_FIX,
    DONE
};

inline std::string parseStateToString(ParseState state) {
    switch (state) {
        case ParseState::SEEKING_ANALYSIS: return "SEEKING_ANALYSIS";
        case ParseState::IN_ANALYSIS:      return "IN_ANALYSIS";
        case ParseState::SEEKING_FIX:      return "SEEKING_FIX";
        case ParseState::IN_FIX:           return "IN_FIX";
        case ParseState::DONE:             return "DONE";
    }
    return "UNKNOWN";
}

struct ParsedDiagnosis {
    std::string analysisText;
    std::string rawScript;
    bool wellFormed = false;
    ParseState finalState = ParseState::SEEKING_ANALYSIS;
};

// ---- Sanitized script ----

/// One rewrite performed by the script sanitizer.
struct AppliedRewrite {
    std::string rule;
    std::string original;
    std::string replacement;
    size_t line = 0;
};

struct SanitizedScript {
    std::string text;
    bool guardInjected = false;
    std::vector<AppliedRewrite> rewrites;

    bool empty() const { return text.empty(); }
};

// ---- Safety ----

enum class SafetyRule {
    ELEVATION_GUARD,
    SERVICE_EXISTENCE_CHECK,
    DESTRUCTIVE_PATH,
    ERROR_SUPPRESSION,
    FORBIDDEN_COMMAND
};

inline std::string safetyRuleToString(SafetyRule rule) {
    switch (rule) {
        case SafetyRule::ELEVATION_GUARD:         return "elevation_guard";
        case SafetyRule::SERVICE_EXISTENCE_CHECK: return "service_existence_check";
        case SafetyRule::DESTRUCTIVE_PATH:        return "destructive_path";
        case SafetyRule::ERROR_SUPPRESSION:       return "error_suppression";
        case SafetyRule::FORBIDDEN_COMMAND:       return "forbidden_command";
    }
    return "unknown";
}

struct SafetyViolation {
    SafetyRule rule = SafetyRule::ELEVATION_GUARD;
    size_t lineNumber = 0;      // 1-based, 0 when the violation concerns the whole script
    std::string offendingLine;
    std::string detail;
};

struct SafetyReport {
    bool passed = false;
    std::vector<SafetyViolation> violations;
};

// ---- Execution ----

struct ExecutionResult {
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    std::optional<std::string> restorePointId;
    std::optional<std::string> restorePointError;
    bool launched = false;
    bool timedOut = false;

    /// Launched, finished in time, exit code 0 and nothing on stderr.
    bool succeeded() const;
};

// ---- Run record ----

enum class ErrorKind {
    UPSTREAM_MALFORMED,
    SAFETY_VIOLATION,
    EXECUTION_FAILURE,
    CONTRACT_VIOLATION,
    TRANSPORT_FAILURE
};

inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UPSTREAM_MALFORMED: return "UpstreamMalformed";
        case ErrorKind::SAFETY_VIOLATION:   return "SafetyViolation";
        case ErrorKind::EXECUTION_FAILURE:  return "ExecutionFailure";
        case ErrorKind::CONTRACT_VIOLATION: return "ContractViolation";
        case ErrorKind::TRANSPORT_FAILURE:  return "TransportFailure";
    }
    return "Unknown";
}

struct RunIssue {
    ErrorKind kind = ErrorKind::UPSTREAM_MALFORMED;
    std::string message;
};

enum class RemediationStatus {
    NOT_OFFERED,
    BLOCKED,
    DECLINED,
    SUCCEEDED,
    FAILED
};

inline std::string remediationStatusToString(RemediationStatus status) {
    switch (status) {
        case RemediationStatus::NOT_OFFERED: return "NOT_OFFERED";
        case RemediationStatus::BLOCKED:     return "BLOCKED";
        case RemediationStatus::DECLINED:    return "DECLINED";
        case RemediationStatus::SUCCEEDED:   return "SUCCEEDED";
        case RemediationStatus::FAILED:      return "FAILED";
    }
    return "UNKNOWN";
}

/// ISO-8601 local timestamp used in reports and restore point descriptions.
REMEDY_API std::string formatTimestamp(std::chrono::system_clock::time_point tp);

} // namespace remedy
