// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// The only way text enters the diagnostic report.

#pragma once

#include <string>

#include "remedy/export.h"

namespace remedy {

class ReportSanitizer;

/// Markup that is free of script/style elements, event-handler attributes and
/// unescaped user input. Only ReportSanitizer can create a non-empty fragment.
class REMEDY_API SanitizedReportFragment {
public:
    SanitizedReportFragment() = default;

    const std::string& html() const { return html_; }
    bool empty() const { return html_.empty(); }

private:
    friend class ReportSanitizer;
    explicit SanitizedReportFragment(std::string html) : html_(std::move(html)) {}

    std::string html_;
};

class REMEDY_API ReportSanitizer {
public:
    /// Model-authored HTML prose: removes script, style, iframe, object and embed
    /// elements and on* attributes, and replaces javascript:, vbscript: and data:
    /// attribute values with "#blocked:". Tags are scanned the way a browser
    /// tokenizes them, so a '>' inside a quoted value does not end the tag.
    /// Runs in linear passes; input size does not bound recursion depth.
    static SanitizedReportFragment sanitizeModelText(const std::string& text);

    /// Literal text (problem description, process output, telemetry values):
    /// every markup character is entity-escaped.
    static SanitizedReportFragment escapeUserText(const std::string& text);

    /// Entity-escape & < > " '.
    static std::string escapeHtml(const std::string& text);
};

} // namespace remedy
