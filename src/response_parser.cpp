// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/response_parser.h"

#include <cstring>

#include "remedy/response_schema.h"

namespace remedy {

ParsedDiagnosis ResponseParser::parse(const std::string& text) {
    using schema::kAnalysis;
    using schema::kFix;
    constexpr size_t npos = std::string::npos;

    ParsedDiagnosis result;
    ParseState state = ParseState::SEEKING_ANALYSIS;
    size_t pos = 0;
    bool analysisClosed = false;
    bool fixClosed = false;

    while (state != ParseState::DONE) {
        switch (state) {
            case ParseState::SEEKING_ANALYSIS: {
                size_t a = text.find(kAnalysis.open, pos);
                size_t f = text.find(kFix.open, pos);
                if (a == npos && f == npos) {
                    state = ParseState::DONE;
                } else if (a != npos && (f == npos || a < f)) {
                    pos = a + std::strlen(kAnalysis.open);
                    state = ParseState::IN_ANALYSIS;
                } else {
                    pos = f + std::strlen(kFix.open);
                    state = ParseState::IN_FIX;
                }
                break;
            }

            case ParseState::IN_ANALYSIS: {
                size_t c = text.find(kAnalysis.close, pos);
                size_t f = text.find(kFix.open, pos);
                if (c != npos && (f == npos || c < f)) {
                    result.analysisText = text.substr(pos, c - pos);
                    analysisClosed = true;
                    pos = c + std::strlen(kAnalysis.close);
                    state = ParseState::SEEKING_FIX;
                } else if (f != npos) {
                    // Unclosed analysis: the fix opening bounds it
                    result.analysisText = text.substr(pos, f - pos);
                    pos = f + std::strlen(kFix.open);
                    state = ParseState::IN_FIX;
                } else {
                    result.analysisText = text.substr(pos);
                    pos = text.size();
                    result.finalState = ParseState::IN_ANALYSIS;
                    state = ParseState::DONE;
                }
                break;
            }

            case ParseState::SEEKING_FIX: {
                size_t f = text.find(kFix.open, pos);
                if (f == npos) {
                    result.finalState = ParseState::SEEKING_FIX;
                    state = ParseState::DONE;
                } else {
                    pos = f + std::strlen(kFix.open);
                    state = ParseState::IN_FIX;
                }
                break;
            }

            case ParseState::IN_FIX: {
                size_t c = text.find(kFix.close, pos);
                if (c == npos) {
                    // Truncated script is never offered
                    result.finalState = ParseState::IN_FIX;
                } else {
                    result.rawScript = text.substr(pos, c - pos);
                    fixClosed = true;
                    result.finalState = ParseState::DONE;
                }
                state = ParseState::DONE;
                break;
            }

            case ParseState::DONE:
                break;
        }
    }

    result.wellFormed = analysisClosed && fixClosed;
    return result;
}

} // namespace remedy
