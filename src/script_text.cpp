// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/script_text.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <regex>
#include <set>
#include <sstream>
#include <utility>

namespace remedy {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Parameters that never take a value.
const std::set<std::string> kSwitchParameters = {
    "-recurse", "-r", "-force", "-whatif", "-confirm", "-passthru", "-verbose", "-debug",
    "-nowait", "-asjob", "-file", "-directory", "-hidden", "-system", "-readonly", "-nonewline",
};

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string masked = maskQuoted(text);
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        if (std::isspace(static_cast<unsigned char>(masked[i]))) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += text[i];
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

/// Token i plus any comma-continued tokens ("a," "b" or "a" ",b").
std::pair<std::string, size_t> collectValue(const std::vector<std::string>& tokens, size_t i) {
    std::string value = tokens[i];
    size_t j = i + 1;
    while (j < tokens.size() && (value.back() == ',' || tokens[j].front() == ',')) {
        value += tokens[j];
        ++j;
    }
    return {value, j};
}

std::vector<std::string> splitList(std::string value) {
    value = trim(value);
    if (value.rfind("@(", 0) == 0) value = value.substr(2);
    else if (value.rfind("(", 0) == 0) value = value.substr(1);
    if (!value.empty() && value.back() == ')') value.pop_back();

    std::vector<std::string> items;
    std::string masked = maskQuoted(value);
    size_t start = 0;
    for (size_t i = 0; i <= value.size(); ++i) {
        if (i == value.size() || masked[i] == ',') {
            std::string item = unquote(trim(value.substr(start, i - start)));
            if (!item.empty()) items.push_back(item);
            start = i + 1;
        }
    }
    return items;
}

std::string parameterName(const std::string& token) {
    std::string lower = toLowerCopy(token);
    size_t colon = lower.find(':');
    return colon == std::string::npos ? lower : lower.substr(0, colon);
}

// Common parameters every cmdlet accepts. A prefix that also starts one of
// these (other than the one asked for) is ambiguous and binds to nothing.
const char* const kCommonParameters[] = {
    "-erroraction", "-errorvariable", "-warningaction", "-warningvariable",
    "-informationaction", "-informationvariable", "-outvariable", "-outbuffer",
    "-pipelinevariable", "-verbose", "-debug", "-whatif", "-confirm",
};

bool isPrefixOf(const std::string& prefix, const std::string& full) {
    return prefix.size() <= full.size() && full.compare(0, prefix.size(), prefix) == 0;
}

/// PowerShell binds "-Recu" to -Recurse: any prefix of at least two letters
/// names a parameter unless it is ambiguous with a common parameter.
bool matchesParameter(const std::string& name, const std::string& full) {
    if (name == full) return true;
    if (name.size() < 3 || !isPrefixOf(name, full)) return false;
    for (const char* common : kCommonParameters) {
        if (full != common && isPrefixOf(name, common)) return false;
    }
    return true;
}

bool nameIn(const std::string& name, std::initializer_list<const char*> names) {
    return std::any_of(names.begin(), names.end(),
                       [&](const char* n) { return matchesParameter(name, n); });
}

bool isSwitchParameter(const std::string& name) {
    return std::any_of(kSwitchParameters.begin(), kSwitchParameters.end(),
                       [&](const std::string& s) { return matchesParameter(name, s); });
}

} // namespace

// ---- Script header ----

namespace {

/// Skips whitespace, # line comments and <# #> block comments.
size_t skipTrivia(const std::string& s, size_t i) {
    while (i < s.size()) {
        if (std::isspace(static_cast<unsigned char>(s[i]))) {
            ++i;
        } else if (s.compare(i, 2, "<#") == 0) {
            size_t end = s.find("#>", i + 2);
            if (end == std::string::npos) return s.size();
            i = end + 2;
        } else if (s[i] == '#') {
            size_t end = s.find('\n', i);
            if (end == std::string::npos) return s.size();
            i = end + 1;
        } else {
            break;
        }
    }
    return i;
}

/// Index just past the bracket matching s[i], skipping quoted text and
/// comments; npos if it is never closed.
size_t skipBalanced(const std::string& s, size_t i) {
    const char open = s[i];
    const char close = open == '(' ? ')' : open == '[' ? ']' : '}';
    int depth = 0;
    while (i < s.size()) {
        char c = s[i];
        if (c == '\'' || c == '"') {
            size_t j = i + 1;
            while (j < s.size() && s[j] != c) {
                if (c == '"' && s[j] == '`') ++j;
                ++j;
            }
            if (j >= s.size()) return std::string::npos;
            i = j + 1;
            continue;
        }
        if (c == '#' || s.compare(i, 2, "<#") == 0) {
            size_t next = skipTrivia(s, i);
            if (next == i) ++next;
            i = next;
            continue;
        }
        if (c == open) ++depth;
        if (c == close && --depth == 0) return i + 1;
        ++i;
    }
    return std::string::npos;
}

} // namespace

size_t leadingParamBlockEnd(const std::string& script) {
    size_t i = skipTrivia(script, 0);
    while (i < script.size() && script[i] == '[') {
        size_t end = skipBalanced(script, i);
        if (end == std::string::npos) return 0;
        i = skipTrivia(script, end);
    }

    if (toLowerCopy(script.substr(i, 5)) != "param") return 0;
    i += 5;
    while (i < script.size() && std::isspace(static_cast<unsigned char>(script[i]))) ++i;
    if (i >= script.size() || script[i] != '(') return 0;

    size_t end = skipBalanced(script, i);
    return end == std::string::npos ? 0 : end;
}

// ---- Lines ----

std::vector<ScriptLine> splitScriptLines(const std::string& script) {
    std::vector<ScriptLine> lines;
    std::istringstream in(script);
    std::string line;
    size_t number = 0;
    bool inBlockComment = false;
    std::string hereStringEnd;

    while (std::getline(in, line)) {
        ++number;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t i = 0;
        if (!hereStringEnd.empty()) {
            std::string t = trim(line);
            if (t.rfind(hereStringEnd, 0) != 0) continue;
            hereStringEnd.clear();
            i = line.find(t) + 2;
        }

        std::string code;
        char quote = 0;
        while (i < line.size()) {
            char c = line[i];
            if (inBlockComment) {
                if (line.compare(i, 2, "#>") == 0) {
                    inBlockComment = false;
                    i += 2;
                } else {
                    ++i;
                }
                continue;
            }
            if (quote) {
                code += c;
                if (c == '`' && quote == '"' && i + 1 < line.size()) {
                    code += line[i + 1];
                    i += 2;
                    continue;
                }
                if (c == quote) quote = 0;
                ++i;
                continue;
            }
            if (c == '<' && i + 1 < line.size() && line[i + 1] == '#') {
                inBlockComment = true;
                i += 2;
                continue;
            }
            if (c == '#') break;
            if (c == '"' || c == '\'') quote = c;
            code += c;
            ++i;
        }

        code = trim(code);
        if (endsWith(code, "@\"")) hereStringEnd = "\"@";
        else if (endsWith(code, "@'")) hereStringEnd = "'@";

        if (!code.empty()) {
            lines.push_back({number, code, trim(line)});
        }
    }
    return lines;
}

std::string maskQuoted(const std::string& code) {
    std::string out = code;
    char quote = 0;
    for (size_t i = 0; i < code.size(); ++i) {
        char c = code[i];
        if (quote) {
            if (c == '`' && quote == '"' && i + 1 < code.size()) {
                out[i] = '_';
                out[i + 1] = '_';
                ++i;
                continue;
            }
            if (c == quote) {
                quote = 0;
                continue;
            }
            out[i] = '_';
        } else if (c == '"' || c == '\'') {
            quote = c;
        }
    }
    return out;
}

// ---- Invocations ----

std::vector<Invocation> findInvocations(const std::vector<ScriptLine>& lines,
                                        const std::vector<std::string>& commands) {
    static const std::regex assignment(R"(\$([A-Za-z_][A-Za-z0-9_]*)\s*=\s*$)");

    std::vector<Invocation> found;
    for (const auto& line : lines) {
        const std::string& code = line.code;
        std::string masked = maskQuoted(code);
        std::string lower = toLowerCopy(masked);

        std::vector<std::pair<size_t, std::string>> hits;
        for (const auto& name : commands) {
            size_t pos = 0;
            while ((pos = lower.find(name, pos)) != std::string::npos) {
                size_t end = pos + name.size();
                bool prevOk = pos == 0 || std::isspace(static_cast<unsigned char>(lower[pos - 1])) ||
                              std::strchr("(|;{=&", lower[pos - 1]) != nullptr;
                bool nextOk = end == lower.size() || std::isspace(static_cast<unsigned char>(lower[end])) ||
                              std::strchr(";|)}", lower[end]) != nullptr;
                if (prevOk && nextOk) hits.emplace_back(pos, name);
                pos = end;
            }
        }
        std::sort(hits.begin(), hits.end());

        for (const auto& [pos, name] : hits) {
            size_t argStart = pos + name.size();
            size_t argEnd = argStart;
            int depth = 0;
            for (; argEnd < masked.size(); ++argEnd) {
                char c = masked[argEnd];
                if (c == '(') {
                    ++depth;
                } else if (c == ')') {
                    if (depth == 0) break;
                    --depth;
                } else if (depth == 0 && std::strchr(";|{}", c) != nullptr) {
                    break;
                }
            }

            Invocation inv;
            inv.command = name;
            inv.line = line.number;
            inv.column = pos + 1;
            inv.args = tokenize(code.substr(argStart, argEnd - argStart));
            inv.lineText = line.raw;

            // Statement start: nearest unbalanced '{' or ';' to the left, skipping
            // over script blocks such as "Where-Object { ... }"
            size_t stmtStart = 0;
            int braces = 0;
            for (size_t k = pos; k > 0; --k) {
                char c = masked[k - 1];
                if (c == '}') {
                    ++braces;
                } else if (c == '{') {
                    if (braces == 0) { stmtStart = k; break; }
                    --braces;
                } else if (c == ';' && braces == 0) {
                    stmtStart = k;
                    break;
                }
            }
            std::string prefix = masked.substr(stmtStart, pos - stmtStart);
            std::string trimmedPrefix = trim(prefix);

            if (!trimmedPrefix.empty() && trimmedPrefix.back() == '|') {
                inv.piped = true;
                size_t pipePos = masked.rfind('|', pos);
                inv.pipelineSource = trim(code.substr(stmtStart, pipePos - stmtStart));
            }

            std::smatch m;
            if (std::regex_search(prefix, m, assignment)) {
                inv.assignedTo = "$" + toLowerCopy(m[1].str());
            }

            found.push_back(std::move(inv));
        }
    }
    return found;
}

// ---- Tokens ----

std::string toLowerCopy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string unquote(const std::string& token) {
    if (token.size() >= 2) {
        char first = token.front();
        char last = token.back();
        if ((first == '"' || first == '\'') && last == first) {
            return token.substr(1, token.size() - 2);
        }
    }
    return token;
}

bool isParameterToken(const std::string& token) {
    return token.size() >= 2 && token[0] == '-' &&
           std::isalpha(static_cast<unsigned char>(token[1]));
}

std::vector<std::string> parameterValues(const Invocation& inv,
                                         std::initializer_list<const char*> names) {
    std::vector<std::string> values;
    const auto& tokens = inv.args;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!isParameterToken(tokens[i]) || !nameIn(parameterName(tokens[i]), names)) continue;

        size_t colon = tokens[i].find(':');
        if (colon != std::string::npos) {
            auto items = splitList(tokens[i].substr(colon + 1));
            values.insert(values.end(), items.begin(), items.end());
        } else if (i + 1 < tokens.size() && !isParameterToken(tokens[i + 1])) {
            auto [value, next] = collectValue(tokens, i + 1);
            auto items = splitList(value);
            values.insert(values.end(), items.begin(), items.end());
            i = next - 1;
        }
    }
    return values;
}

std::vector<std::string> positionalValues(const Invocation& inv) {
    std::vector<std::string> values;
    const auto& tokens = inv.args;
    size_t i = 0;
    while (i < tokens.size()) {
        if (isParameterToken(tokens[i])) {
            std::string name = parameterName(tokens[i]);
            bool selfContained = tokens[i].find(':') != std::string::npos ||
                                 isSwitchParameter(name);
            if (!selfContained && i + 1 < tokens.size() && !isParameterToken(tokens[i + 1])) {
                i = collectValue(tokens, i + 1).second;
            } else {
                ++i;
            }
            continue;
        }
        auto [value, next] = collectValue(tokens, i);
        auto items = splitList(value);
        values.insert(values.end(), items.begin(), items.end());
        i = next;
    }
    return values;
}

bool hasSwitch(const Invocation& inv, std::initializer_list<const char*> names) {
    for (const auto& token : inv.args) {
        if (!isParameterToken(token) || !nameIn(parameterName(token), names)) continue;
        size_t colon = token.find(':');
        if (colon == std::string::npos) return true;
        return toLowerCopy(token.substr(colon + 1)) != "$false";
    }
    return false;
}

std::string errorActionValue(const Invocation& inv) {
    auto values = parameterValues(inv, {"-erroraction", "-ea"});
    return values.empty() ? std::string() : toLowerCopy(values.front());
}

} // namespace remedy
