// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// The single definition of the model output contract.
// PromptBuilder renders it into the request; ResponseParser matches against it.

#pragma once

#include <string>

#include "remedy/export.h"

namespace remedy {
namespace schema {

struct SectionMarkers {
    const char* name;
    const char* open;
    const char* close;
};

inline constexpr SectionMarkers kAnalysis{"ANALYSIS", "[ANALYSIS_START]", "[ANALYSIS_END]"};
inline constexpr SectionMarkers kFix{"FIX", "[FIX_START]", "[FIX_END]"};

/// Instruction block telling the model to emit exactly the two delimited sections.
REMEDY_API std::string outputContract();

/// True if text contains any sentinel token.
REMEDY_API bool containsSentinel(const std::string& text);

/// Replace the brackets of every sentinel token in text with parentheses so that
/// echoed data can never be mistaken for a section boundary.
REMEDY_API std::string defuseSentinels(const std::string& text);

} // namespace schema
} // namespace remedy
