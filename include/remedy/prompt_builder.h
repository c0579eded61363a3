// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Renders a telemetry snapshot and the user's complaint into a model request.

#pragma once

#include <string>
#include <vector>

#include "remedy/export.h"
#include "remedy/types.h"

namespace remedy {

struct PromptConfig {
    std::vector<std::string> categories;  // telemetry categories to include, in order
    size_t maxFieldChars = 2000;          // longer string values are truncated
};

class REMEDY_API PromptBuilder {
public:
    explicit PromptBuilder(PromptConfig config);

    /// Always produces a complete request. userText is embedded as opaque data.
    ModelRequest build(const TelemetrySnapshot& snapshot, const std::string& userText) const;

    /// Fixed preamble: role, tasks, script rules and the output contract.
    static std::string instructions();

    const PromptConfig& config() const { return config_; }

private:
    json selectTelemetry(const TelemetrySnapshot& snapshot) const;

    PromptConfig config_;
};

} // namespace remedy
