// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/safety_validator.h"

#include <algorithm>
#include <cstddef>
#include <regex>
#include <set>

#include "remedy/script_sanitizer.h"

namespace remedy {

namespace {

const std::vector<std::string> kServiceCommands = {
    "get-service", "gsv", "stop-service", "spsv", "restart-service", "suspend-service",
    "set-service", "sc", "sc.exe", "net", "net.exe",
};

const std::vector<std::string> kDeleteCommands = {
    "remove-item", "ri", "rm", "rmdir", "rd", "del", "erase",
};

const std::vector<std::string> kFormatCommands = {
    "format-volume", "clear-disk", "format", "format.com",
};

const std::set<std::string> kBestEffortCommands = {
    "stop-service", "spsv", "start-service", "sasv", "restart-service", "set-service",
    "suspend-service", "resume-service", "remove-item", "ri", "rm", "rmdir", "rd", "del",
    "erase", "clear-dnsclientcache", "clear-recyclebin", "stop-process", "spps", "kill",
};

const std::set<std::string> kCriticalCommands = {
    "checkpoint-computer", "enable-computerrestore",
};

const std::vector<std::string> kForbiddenInvocations = {
    "stop-computer", "restart-computer", "initialize-disk", "invoke-expression", "iex",
    "set-executionpolicy", "disable-computerrestore", "vssadmin", "vssadmin.exe",
    "bcdedit", "bcdedit.exe", "shutdown", "shutdown.exe",
    "start-bitstransfer", "invoke-command", "icm", "invoke-restmethod", "irm",
};

// Allowed for connectivity checks, forbidden once they save a payload.
const std::vector<std::string> kWebRequestCommands = {
    "invoke-webrequest", "iwr", "wget", "curl",
};

struct ForbiddenPattern {
    const char* pattern;
    const char* detail;
};

const std::vector<ForbiddenPattern> kForbiddenPatterns = {
    {R"(\s-enc(odedcommand)?\b)", "encoded command payload"},
    {R"(frombase64string)", "base64-decoded payload"},
    {R"(\.download(string|file|data)\s*\()", "remote download"},
    {R"(\bnet\.webclient\b)", "web client download"},
    {R"(\[scriptblock\]\s*::\s*create\s*\()", "script block built from a string"},
    {R"(\breg(\.exe)?\s+delete\s+["']?hklm\\(system|software\\microsoft\\windows)\b)",
     "deletion of a core registry hive"},
};

std::vector<std::string> concat(std::initializer_list<const std::vector<std::string>*> lists) {
    std::vector<std::string> out;
    for (const auto* list : lists) out.insert(out.end(), list->begin(), list->end());
    return out;
}

/// "$svc.Name" and "$svc" refer to the same checked variable.
std::string serviceKey(const std::string& name) {
    std::string key = toLowerCopy(name);
    if (!key.empty() && key[0] == '$') {
        size_t dot = key.find('.');
        if (dot != std::string::npos) key = key.substr(0, dot);
    }
    return key;
}

std::vector<std::string> serviceTargets(const Invocation& inv) {
    auto names = parameterValues(inv, {"-name", "-displayname", "-inputobject"});
    auto positional = positionalValues(inv);
    names.insert(names.end(), positional.begin(), positional.end());
    return names;
}

bool isSuppressed(const std::string& errorAction) {
    if (errorAction.empty()) return false;
    auto endsWith = [&](const std::string& suffix) {
        return errorAction.size() >= suffix.size() &&
               errorAction.compare(errorAction.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return errorAction == "0" || endsWith("silentlycontinue") || endsWith("ignore");
}

SafetyViolation violation(SafetyRule rule, const Invocation& inv, std::string detail) {
    return SafetyViolation{rule, inv.line, inv.lineText, std::move(detail)};
}

size_t lineOffset(const std::string& text, size_t lineNumber) {
    size_t offset = 0;
    for (size_t n = 1; n < lineNumber && offset != std::string::npos; ++n) {
        offset = text.find('\n', offset);
        if (offset != std::string::npos) ++offset;
    }
    return offset == std::string::npos ? text.size() : offset;
}

} // namespace

SafetyValidator::SafetyValidator() : SafetyValidator(ValidatorConfig{}) {}

SafetyValidator::SafetyValidator(ValidatorConfig config) : config_(std::move(config)) {
    for (const auto& root : config_.ephemeralPaths) {
        std::string normalized = normalizePath(root);
        if (!normalized.empty()) normalizedRoots_.push_back(normalized);
    }

    rules_ = {
        {SafetyRule::ELEVATION_GUARD,
         "Elevation guard present and first executable statement",
         &SafetyValidator::checkElevationGuard},
        {SafetyRule::SERVICE_EXISTENCE_CHECK,
         "Service stop/disable/restart preceded by an existence check for the same name",
         &SafetyValidator::checkServiceExistence},
        {SafetyRule::DESTRUCTIVE_PATH,
         "Recursive or wildcard deletes only under ephemeral directories; no disk formats",
         &SafetyValidator::checkDestructivePaths},
        {SafetyRule::ERROR_SUPPRESSION,
         "Best-effort commands suppress errors; critical commands do not",
         &SafetyValidator::checkErrorSuppression},
        {SafetyRule::FORBIDDEN_COMMAND,
         "No reboot, disk initialisation, dynamic code or remote payloads",
         &SafetyValidator::checkForbiddenCommands},
    };
}

std::vector<SafetyValidator::RuleInfo> SafetyValidator::rules() const {
    std::vector<RuleInfo> info;
    for (const auto& rule : rules_) info.push_back({rule.id, rule.description});
    return info;
}

SafetyReport SafetyValidator::validate(const SanitizedScript& script) const {
    return validate(script.text);
}

SafetyReport SafetyValidator::validate(const std::string& scriptText) const {
    ScriptView view{scriptText, splitScriptLines(scriptText)};

    SafetyReport report;
    for (const auto& rule : rules_) {
        (this->*rule.check)(view, report.violations);
    }
    std::stable_sort(report.violations.begin(), report.violations.end(),
                     [](const SafetyViolation& a, const SafetyViolation& b) {
                         return a.lineNumber < b.lineNumber;
                     });
    report.passed = report.violations.empty();
    return report;
}

// ---- Paths ----

std::string SafetyValidator::normalizePath(const std::string& path) {
    static const std::regex subexpr(R"(\$\(\s*\$env:([A-Za-z_][A-Za-z0-9_]*)\s*\))",
                                    std::regex::icase);
    static const std::regex braced(R"(\$\{env:([A-Za-z_][A-Za-z0-9_]*)\})", std::regex::icase);

    std::string p = unquote(path);
    p = std::regex_replace(p, subexpr, "$$env:$1");
    p = std::regex_replace(p, braced, "$$env:$1");
    std::replace(p.begin(), p.end(), '/', '\\');
    p = toLowerCopy(p);

    std::string collapsed;
    for (char c : p) {
        if (c == '\\' && !collapsed.empty() && collapsed.back() == '\\') continue;
        collapsed += c;
    }
    while (collapsed.size() > 1 && collapsed.back() == '\\') collapsed.pop_back();
    return collapsed;
}

bool SafetyValidator::isEphemeralPath(const std::string& path) const {
    std::string p = normalizePath(path);
    if (p.empty() || p.find("..") != std::string::npos) return false;
    // Any other variable or subexpression could point anywhere
    if (p.find('$', 1) != std::string::npos || p.find('(') != std::string::npos) return false;

    for (const auto& root : normalizedRoots_) {
        if (p == root || p.rfind(root + "\\", 0) == 0) return true;
    }
    return false;
}

// ---- Rules ----

void SafetyValidator::checkElevationGuard(const ScriptView& view,
                                          std::vector<SafetyViolation>& out) const {
    const std::string& guard = ScriptSanitizer::elevationGuardBody();
    if (view.lines.empty()) {
        out.push_back({SafetyRule::ELEVATION_GUARD, 0, "", "script has no executable statements"});
        return;
    }

    // The guard is the first statement after the param() block, if there is one
    size_t headerEnd = leadingParamBlockEnd(view.text);
    std::string rest = view.text.substr(headerEnd);
    size_t lineShift = static_cast<size_t>(
        std::count(view.text.begin(), view.text.begin() + static_cast<std::ptrdiff_t>(headerEnd), '\n'));
    auto restLines = headerEnd == 0 ? view.lines : splitScriptLines(rest);
    if (restLines.empty()) {
        out.push_back({SafetyRule::ELEVATION_GUARD, view.lines.back().number, view.lines.back().raw,
                       "elevation guard is missing"});
        return;
    }

    const ScriptLine& first = restLines.front();
    size_t offset = lineOffset(rest, first.number);
    offset = rest.find_first_not_of(" \t", offset);
    if (offset != std::string::npos && rest.compare(offset, guard.size(), guard) == 0) {
        return;
    }

    std::string detail = view.text.find(guard) == std::string::npos
        ? "elevation guard is missing"
        : "elevation guard is present but is not the first executable statement";
    out.push_back({SafetyRule::ELEVATION_GUARD, first.number + lineShift, first.raw, detail});
}

void SafetyValidator::checkServiceExistence(const ScriptView& view,
                                            std::vector<SafetyViolation>& out) const {
    std::set<std::string> checked;

    auto requireChecked = [&](const Invocation& inv, const std::vector<std::string>& targets) {
        if (targets.empty()) {
            std::string source = toLowerCopy(inv.pipelineSource);
            bool fedByGetService = inv.piped && (source.find("get-service") != std::string::npos ||
                                                 source.rfind("gsv", 0) == 0);
            if (!fedByGetService) {
                out.push_back(violation(SafetyRule::SERVICE_EXISTENCE_CHECK, inv,
                                        "'" + inv.command + "' has no determinable target service"));
            }
            return;
        }
        for (const auto& target : targets) {
            if (checked.count(serviceKey(target)) == 0) {
                out.push_back(violation(SafetyRule::SERVICE_EXISTENCE_CHECK, inv,
                                        "'" + inv.command + "' targets service '" + target +
                                        "' without a preceding existence check"));
            }
        }
    };

    for (const auto& inv : findInvocations(view.lines, kServiceCommands)) {
        const std::string& cmd = inv.command;

        if (cmd == "get-service" || cmd == "gsv") {
            for (const auto& name : serviceTargets(inv)) checked.insert(serviceKey(name));
            if (!inv.assignedTo.empty()) checked.insert(inv.assignedTo);
        } else if (cmd == "stop-service" || cmd == "spsv" || cmd == "restart-service" ||
                   cmd == "suspend-service") {
            requireChecked(inv, serviceTargets(inv));
        } else if (cmd == "set-service") {
            auto startup = parameterValues(inv, {"-startuptype", "-startmode"});
            auto status = parameterValues(inv, {"-status"});
            bool disables = !startup.empty() && toLowerCopy(startup.front()) == "disabled";
            bool stops = !status.empty() && (toLowerCopy(status.front()) == "stopped" ||
                                             toLowerCopy(status.front()) == "paused");
            if (disables || stops) requireChecked(inv, serviceTargets(inv));
        } else if (cmd == "sc" || cmd == "sc.exe") {
            if (inv.args.empty()) continue;
            std::string verb = toLowerCopy(unquote(inv.args[0]));
            std::vector<std::string> target;
            if (inv.args.size() > 1) target.push_back(unquote(inv.args[1]));

            if (verb == "query" || verb == "qc" || verb == "queryex") {
                for (const auto& t : target) checked.insert(serviceKey(t));
            } else if (verb == "stop") {
                requireChecked(inv, target);
            } else if (verb == "config") {
                std::string rest;
                for (const auto& a : inv.args) rest += toLowerCopy(a) + " ";
                if (rest.find("start=") != std::string::npos &&
                    rest.find("disabled") != std::string::npos) {
                    requireChecked(inv, target);
                }
            }
        } else if (cmd == "net" || cmd == "net.exe") {
            if (!inv.args.empty() && toLowerCopy(inv.args[0]) == "stop") {
                std::vector<std::string> target;
                if (inv.args.size() > 1) target.push_back(unquote(inv.args[1]));
                requireChecked(inv, target);
            }
        }
    }
}

void SafetyValidator::checkDestructivePaths(const ScriptView& view,
                                            std::vector<SafetyViolation>& out) const {
    static const std::vector<std::string> listingCommands = {"get-childitem", "gci", "dir", "ls"};

    for (const auto& inv : findInvocations(view.lines, concat({&kDeleteCommands, &kFormatCommands}))) {
        if (std::find(kFormatCommands.begin(), kFormatCommands.end(), inv.command) != kFormatCommands.end()) {
            out.push_back(violation(SafetyRule::DESTRUCTIVE_PATH, inv,
                                    "'" + inv.command + "' formats or clears a disk"));
            continue;
        }

        bool recursive = hasSwitch(inv, {"-recurse", "-r"});
        std::vector<std::string> paths = parameterValues(inv, {"-path", "-literalpath", "-pspath"});
        for (const auto& value : positionalValues(inv)) {
            std::string lower = toLowerCopy(value);
            if (lower == "/s") recursive = true;
            else if (lower != "/q" && lower != "/f") paths.push_back(value);
        }

        if (paths.empty() && inv.piped) {
            ScriptLine source{inv.line, inv.pipelineSource, inv.pipelineSource};
            for (const auto& listing : findInvocations({source}, listingCommands)) {
                recursive = recursive || hasSwitch(listing, {"-recurse", "-r"});
                auto p = parameterValues(listing, {"-path", "-literalpath"});
                auto pos = positionalValues(listing);
                paths.insert(paths.end(), p.begin(), p.end());
                paths.insert(paths.end(), pos.begin(), pos.end());
            }
        }

        bool wildcard = std::any_of(paths.begin(), paths.end(), [](const std::string& p) {
            return p.find_first_of("*?") != std::string::npos;
        });
        // Piped input is a bulk delete of whatever the pipeline lists
        if (!recursive && !wildcard && !inv.piped) continue;

        if (paths.empty()) {
            out.push_back(violation(SafetyRule::DESTRUCTIVE_PATH, inv,
                                    "'" + inv.command + "' deletes a path that cannot be determined"));
            continue;
        }
        for (const auto& path : paths) {
            if (!isEphemeralPath(path)) {
                out.push_back(violation(SafetyRule::DESTRUCTIVE_PATH, inv,
                                        "'" + inv.command + "' deletes '" + path +
                                        "' outside the allowed temp/cache directories"));
            }
        }
    }
}

void SafetyValidator::checkErrorSuppression(const ScriptView& view,
                                            std::vector<SafetyViolation>& out) const {
    std::vector<std::string> commands(kBestEffortCommands.begin(), kBestEffortCommands.end());
    commands.insert(commands.end(), kCriticalCommands.begin(), kCriticalCommands.end());

    for (const auto& inv : findInvocations(view.lines, commands)) {
        bool suppressed = isSuppressed(errorActionValue(inv));
        if (kCriticalCommands.count(inv.command) > 0) {
            if (suppressed) {
                out.push_back(violation(SafetyRule::ERROR_SUPPRESSION, inv,
                                        "critical command '" + inv.command +
                                        "' must not suppress errors"));
            }
        } else if (!suppressed) {
            out.push_back(violation(SafetyRule::ERROR_SUPPRESSION, inv,
                                    "best-effort command '" + inv.command +
                                    "' needs -ErrorAction SilentlyContinue"));
        }
    }
}

void SafetyValidator::checkForbiddenCommands(const ScriptView& view,
                                             std::vector<SafetyViolation>& out) const {
    for (const auto& inv : findInvocations(view.lines, kForbiddenInvocations)) {
        out.push_back(violation(SafetyRule::FORBIDDEN_COMMAND, inv,
                                "'" + inv.command + "' is not allowed in a remediation script"));
    }

    for (const auto& inv : findInvocations(view.lines, kWebRequestCommands)) {
        if (!parameterValues(inv, {"-outfile"}).empty()) {
            out.push_back(violation(SafetyRule::FORBIDDEN_COMMAND, inv,
                                    "'" + inv.command + "' downloads a file; remote payloads are not allowed"));
        }
    }

    static const std::vector<std::pair<std::regex, std::string>> compiled = [] {
        std::vector<std::pair<std::regex, std::string>> list;
        for (const auto& p : kForbiddenPatterns) {
            list.emplace_back(std::regex(p.pattern, std::regex::icase), p.detail);
        }
        return list;
    }();

    for (const auto& line : view.lines) {
        for (const auto& [regex, detail] : compiled) {
            if (std::regex_search(line.code, regex)) {
                out.push_back({SafetyRule::FORBIDDEN_COMMAND, line.number, line.raw,
                               detail + " is not allowed in a remediation script"});
            }
        }
    }
}

} // namespace remedy
