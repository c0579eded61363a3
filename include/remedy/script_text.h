// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Lightweight structural view of a PowerShell script: comment-free code lines and
// command invocations with their arguments. Not a parser; good enough for the
// static checks in safety_validator.h and impact_preview.h.

#pragma once

#include <initializer_list>
#include <string>
#include <vector>

#include "remedy/export.h"

namespace remedy {

struct ScriptLine {
    size_t number = 0;   // 1-based
    std::string code;    // comments removed, trimmed
    std::string raw;     // original line, trimmed
};

/// Code lines of a script. Comments (# and <# #>) and here-string bodies are removed;
/// lines left empty are omitted.
REMEDY_API std::vector<ScriptLine> splitScriptLines(const std::string& script);

/// One occurrence of a command inside a code line.
struct Invocation {
    std::string command;             // matched name, lowercase
    size_t line = 0;
    size_t column = 0;
    std::vector<std::string> args;   // whitespace-split tokens, quotes preserved
    bool piped = false;              // input comes from a pipeline
    std::string pipelineSource;      // statement text before the pipe, if piped
    std::string assignedTo;          // "$name" for "$name = <command> ..."
    std::string lineText;            // raw line for reporting
};

/// All invocations of the given (lowercase) command names, in program order.
/// Occurrences inside quoted strings are ignored.
REMEDY_API std::vector<Invocation> findInvocations(const std::vector<ScriptLine>& lines,
                                                   const std::vector<std::string>& commands);

/// Offset just past the script's leading param(...) block (with any comments and
/// attributes such as [CmdletBinding()] before it), or 0 if the script has none.
/// PowerShell requires that block to be the first statement.
REMEDY_API size_t leadingParamBlockEnd(const std::string& script);

/// Replace characters inside quoted strings with '_' (quotes kept) so that
/// structural characters in string literals are not seen.
REMEDY_API std::string maskQuoted(const std::string& code);

REMEDY_API std::string toLowerCopy(const std::string& s);
REMEDY_API std::string unquote(const std::string& token);

/// True for "-Name", "-Recurse:$true" style tokens.
REMEDY_API bool isParameterToken(const std::string& token);

/// Values bound to any of the named parameters (lowercase, with leading '-'),
/// split on commas and unquoted. Handles "-Name a,b", "-Name 'a', 'b'" and "-Name:a".
REMEDY_API std::vector<std::string> parameterValues(const Invocation& inv,
                                                    std::initializer_list<const char*> names);

/// Positional (unnamed) argument values, split on commas and unquoted.
REMEDY_API std::vector<std::string> positionalValues(const Invocation& inv);

/// True if a switch such as -Recurse is present (and not explicitly :$false).
REMEDY_API bool hasSwitch(const Invocation& inv, std::initializer_list<const char*> names);

/// Lowercased -ErrorAction / -EA value, or empty if absent.
REMEDY_API std::string errorActionValue(const Invocation& inv);

} // namespace remedy
