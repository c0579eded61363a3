// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/response_schema.h"

#include <array>

namespace remedy {
namespace schema {

namespace {

const std::array<const char*, 4> kAllSentinels = {
    kAnalysis.open, kAnalysis.close, kFix.open, kFix.close
};

} // namespace

std::string outputContract() {
    std::string s;
    s += "OUTPUT FORMAT (mandatory):\n";
    s += "Reply with exactly two sections and nothing else.\n\n";
    s += kAnalysis.open;
    s += "\n<HTML fragment: root cause, evidence from the telemetry, and a <ul> of the actions the "
         "script takes, each <li> prefixed with [FIXED], [CLEANED] or [DISABLED]>\n";
    s += kAnalysis.close;
    s += "\n\n";
    s += kFix.open;
    s += "\n<one PowerShell script, no Markdown code fences>\n";
    s += kFix.close;
    s += "\n\n";
    s += "Write each marker exactly as shown, on its own line, once. ";
    s += "Do not repeat the markers inside either section.\n";
    return s;
}

bool containsSentinel(const std::string& text) {
    for (const char* token : kAllSentinels) {
        if (text.find(token) != std::string::npos) return true;
    }
    return false;
}

std::string defuseSentinels(const std::string& text) {
    std::string out = text;
    for (const char* token : kAllSentinels) {
        std::string needle(token);
        std::string replacement = "(" + needle.substr(1, needle.size() - 2) + ")";
        size_t pos = 0;
        while ((pos = out.find(needle, pos)) != std::string::npos) {
            out.replace(pos, needle.size(), replacement);
            pos += replacement.size();
        }
    }
    return out;
}

} // namespace schema
} // namespace remedy
