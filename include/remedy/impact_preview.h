// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Dry-run summary of what a remediation script would change, shown before confirmation.

#pragma once

#include <string>
#include <vector>

#include "remedy/export.h"

namespace remedy {

enum class ImpactCategory {
    SERVICE,
    FILE,
    REGISTRY,
    PROCESS,
    NETWORK
};

inline std::string impactCategoryToString(ImpactCategory category) {
    switch (category) {
        case ImpactCategory::SERVICE:  return "service";
        case ImpactCategory::FILE:     return "file";
        case ImpactCategory::REGISTRY: return "registry";
        case ImpactCategory::PROCESS:  return "process";
        case ImpactCategory::NETWORK:  return "network";
    }
    return "unknown";
}

enum class RiskLevel {
    NONE,
    VERY_LOW,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

inline std::string riskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::NONE:     return "NONE";
        case RiskLevel::VERY_LOW: return "VERY LOW";
        case RiskLevel::LOW:      return "LOW";
        case RiskLevel::MEDIUM:   return "MEDIUM";
        case RiskLevel::HIGH:     return "HIGH";
        case RiskLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

struct ImpactItem {
    ImpactCategory category = ImpactCategory::SERVICE;
    std::string action;   // "stop", "disable", "delete", "set", ...
    std::string target;
    size_t line = 0;
};

struct ImpactPreview {
    std::vector<ImpactItem> items;
    int riskScore = 0;
    RiskLevel riskLevel = RiskLevel::NONE;

    size_t count(ImpactCategory category) const;

    /// Multi-line human-readable summary.
    std::string summary() const;
};

/// Static simulation over the script text; never runs anything.
REMEDY_API ImpactPreview previewImpact(const std::string& scriptText);

/// Level for a score: 0 NONE, <5 VERY_LOW, <10 LOW, <20 MEDIUM, <40 HIGH, else CRITICAL.
REMEDY_API RiskLevel riskLevelForScore(int score);

} // namespace remedy
