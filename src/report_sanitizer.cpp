// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/report_sanitizer.h"

#include <cctype>
#include <cstdlib>
#include <vector>

namespace remedy {

namespace {

const char* const kActiveElements[] = {"script", "style", "iframe", "object", "embed"};
const char* const kBlockedSchemes[] = {"javascript:", "vbscript:", "data:"};

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::string lowerAscii(const std::string& s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool startsWithAt(const std::string& s, size_t pos, const std::string& prefix) {
    return s.compare(pos, prefix.size(), prefix) == 0;
}

// ---- Tag scanning ----
//
// Follows the HTML tokenizer: the tag name and attribute names end at
// whitespace, '/' or '>', and quotes only matter at the start of a value.
// A '>' inside a quoted value therefore does not end the tag.

struct Attribute {
    size_t segmentStart = 0;  ///< separator before the attribute
    size_t end = 0;           ///< one past the attribute's last character
    std::string name;         ///< lower-cased
    std::string value;        ///< unquoted
};

struct Tag {
    size_t nameEnd = 0;
    size_t close = std::string::npos;  ///< index of '>', npos when the text ends first
    std::vector<Attribute> attributes;
};

Tag scanTag(const std::string& s, size_t lt) {
    Tag tag;
    size_t i = lt + 1;
    if (i < s.size() && s[i] == '/') ++i;
    while (i < s.size() && !isSpace(s[i]) && s[i] != '/' && s[i] != '>') ++i;
    tag.nameEnd = i;

    while (i < s.size()) {
        size_t segment = i;
        while (i < s.size() && (isSpace(s[i]) || s[i] == '/')) ++i;
        if (i >= s.size()) break;
        if (s[i] == '>') {
            tag.close = i;
            return tag;
        }

        Attribute attr;
        attr.segmentStart = segment;
        size_t nameStart = i++;
        while (i < s.size() && !isSpace(s[i]) && s[i] != '/' && s[i] != '>' && s[i] != '=') ++i;
        attr.name = lowerAscii(s.substr(nameStart, i - nameStart));

        size_t j = i;
        while (j < s.size() && isSpace(s[j])) ++j;
        if (j < s.size() && s[j] == '=') {
            i = j + 1;
            while (i < s.size() && isSpace(s[i])) ++i;
            if (i < s.size() && (s[i] == '"' || s[i] == '\'')) {
                char quote = s[i];
                size_t closeQuote = s.find(quote, i + 1);
                if (closeQuote == std::string::npos) {
                    attr.value = s.substr(i + 1);
                    i = s.size();
                } else {
                    attr.value = s.substr(i + 1, closeQuote - i - 1);
                    i = closeQuote + 1;
                }
            } else {
                size_t valueStart = i;
                while (i < s.size() && !isSpace(s[i]) && s[i] != '>') ++i;
                attr.value = s.substr(valueStart, i - valueStart);
            }
        }
        attr.end = i;
        tag.attributes.push_back(std::move(attr));
    }
    return tag;
}

bool startsTag(const std::string& s, size_t lt) {
    if (lt + 1 >= s.size()) return false;
    char c = s[lt + 1];
    if (c == '/') return lt + 2 < s.size() && std::isalpha(static_cast<unsigned char>(s[lt + 2]));
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

// Decodes the character references a browser would resolve inside an
// attribute value, then drops whitespace and control characters, which URL
// parsing also ignores inside a scheme.
std::string urlSchemeView(const std::string& value) {
    std::string decoded;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '&' && i + 1 < value.size() && value[i + 1] == '#') {
            // Numeric references need no trailing ';'
            bool hex = i + 2 < value.size() && (value[i + 2] == 'x' || value[i + 2] == 'X');
            size_t digits = i + (hex ? 3 : 2);
            size_t end = digits;
            while (end < value.size() &&
                   (hex ? std::isxdigit(static_cast<unsigned char>(value[end]))
                        : std::isdigit(static_cast<unsigned char>(value[end])))) {
                ++end;
            }
            if (end > digits && end - digits <= 6) {
                long code = std::strtol(value.substr(digits, end - digits).c_str(), nullptr, hex ? 16 : 10);
                if (code > 0 && code < 128) {
                    decoded += static_cast<char>(code);
                    i = (end < value.size() && value[end] == ';') ? end : end - 1;
                    continue;
                }
            }
        } else if (value[i] == '&') {
            size_t semi = value.find(';', i);
            std::string ref = semi == std::string::npos ? "" : lowerAscii(value.substr(i + 1, semi - i - 1));
            if (ref == "colon") {
                decoded += ':';
                i = semi;
                continue;
            } else if (ref == "tab" || ref == "newline") {
                i = semi;
                continue;
            }
        }
        decoded += value[i];
    }

    std::string out;
    for (char c : decoded) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u == 0x7f) continue;
        out += static_cast<char>(std::tolower(u));
    }
    return out;
}

bool isBlockedUrl(const std::string& value) {
    std::string view = urlSchemeView(value);
    for (const char* scheme : kBlockedSchemes) {
        if (startsWithAt(view, 0, scheme)) return true;
    }
    return false;
}

/// Rewrites every tag: on* attributes are dropped and script-capable URLs
/// become "#blocked:". Text between tags is copied unchanged.
std::string rewriteTags(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    for (;;) {
        size_t lt = s.find('<', pos);
        if (lt == std::string::npos) {
            out.append(s, pos, std::string::npos);
            return out;
        }
        out.append(s, pos, lt - pos);
        if (!startsTag(s, lt)) {
            out += '<';
            pos = lt + 1;
            continue;
        }

        Tag tag = scanTag(s, lt);
        size_t tagEnd = tag.close == std::string::npos ? s.size() : tag.close + 1;
        out.append(s, lt, tag.nameEnd - lt);
        size_t copied = tag.nameEnd;
        for (const auto& attr : tag.attributes) {
            if (startsWithAt(attr.name, 0, "on")) {
                copied = attr.end;
                continue;
            }
            if (isBlockedUrl(attr.value)) {
                out.append(s, copied, attr.segmentStart - copied);
                out += " " + attr.name + "=\"#blocked:\"";
            } else {
                out.append(s, copied, attr.end - copied);
            }
            copied = attr.end;
        }
        out.append(s, copied, tagEnd - copied);
        pos = tagEnd;
    }
}

// ---- Element removal ----

/// Position of the next "<name" or "</name" tag at or after pos, or npos.
size_t findElementTag(const std::string& lower, const std::string& name, size_t pos, bool closing) {
    std::string needle = (closing ? "</" : "<") + name;
    for (size_t at = lower.find(needle, pos); at != std::string::npos; at = lower.find(needle, at + 1)) {
        size_t after = at + needle.size();
        if (after >= lower.size() || isSpace(lower[after]) || lower[after] == '/' || lower[after] == '>') {
            return at;
        }
    }
    return std::string::npos;
}

/// Removes each element with its content. An element that is never closed
/// runs to the end of the text; a stray closing tag is removed on its own.
std::string removeActiveElements(std::string s) {
    for (const char* element : kActiveElements) {
        std::string name(element);
        std::string lower = lowerAscii(s);

        for (size_t open = findElementTag(lower, name, 0, false); open != std::string::npos;
             open = findElementTag(lower, name, open, false)) {
            size_t end = s.size();
            Tag tag = scanTag(s, open);
            if (tag.close != std::string::npos) {
                size_t close = findElementTag(lower, name, tag.close + 1, true);
                if (close != std::string::npos) {
                    size_t gt = s.find('>', close);
                    end = gt == std::string::npos ? s.size() : gt + 1;
                }
            }
            s.erase(open, end - open);
            lower.erase(open, end - open);
        }

        for (size_t stray = findElementTag(lower, name, 0, true); stray != std::string::npos;
             stray = findElementTag(lower, name, stray, true)) {
            size_t gt = s.find('>', stray);
            size_t end = gt == std::string::npos ? s.size() : gt + 1;
            s.erase(stray, end - stray);
            lower.erase(stray, end - stray);
        }
    }
    return s;
}

} // namespace

SanitizedReportFragment ReportSanitizer::sanitizeModelText(const std::string& text) {
    std::string current = text;

    // Removal can splice a new tag together ("<scr<script></script>ipt>"),
    // so repeat until nothing changes.
    for (;;) {
        std::string next = rewriteTags(removeActiveElements(current));
        if (next == current) break;
        current = std::move(next);
    }
    return SanitizedReportFragment(std::move(current));
}

SanitizedReportFragment ReportSanitizer::escapeUserText(const std::string& text) {
    return SanitizedReportFragment(escapeHtml(text));
}

std::string ReportSanitizer::escapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

} // namespace remedy
