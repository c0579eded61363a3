// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Extracts the analysis and fix sections from free-form model output.

#pragma once

#include <string>

#include "remedy/export.h"
#include "remedy/types.h"

namespace remedy {

/// State machine over the sentinel tokens defined in response_schema.h:
///
///   SEEKING_ANALYSIS -> IN_ANALYSIS -> SEEKING_FIX -> IN_FIX -> DONE
///
/// The first opening sentinel wins and its region ends at the first matching
/// close or, for the analysis, at the first fix opening. Text outside regions is
/// discarded. A fix opening seen before any analysis opening starts the fix
/// region directly. An unterminated fix region yields an empty script.
///
/// Never throws: malformed input produces wellFormed=false.
class REMEDY_API ResponseParser {
public:
    static ParsedDiagnosis parse(const std::string& responseText);
};

} // namespace remedy
