// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/impact_preview.h"

#include <algorithm>
#include <map>
#include <sstream>

#include "remedy/script_text.h"

namespace remedy {

namespace {

struct CommandImpact {
    ImpactCategory category;
    const char* action;
    int weight;
};

// Weights per affected item.
const std::map<std::string, CommandImpact> kCommandImpacts = {
    {"stop-service",          {ImpactCategory::SERVICE,  "stop",    2}},
    {"spsv",                  {ImpactCategory::SERVICE,  "stop",    2}},
    {"restart-service",       {ImpactCategory::SERVICE,  "restart", 2}},
    {"start-service",         {ImpactCategory::SERVICE,  "start",   1}},
    {"sasv",                  {ImpactCategory::SERVICE,  "start",   1}},
    {"suspend-service",       {ImpactCategory::SERVICE,  "suspend", 2}},
    {"set-service",           {ImpactCategory::SERVICE,  "configure", 2}},
    {"remove-item",           {ImpactCategory::FILE,     "delete",  1}},
    {"ri",                    {ImpactCategory::FILE,     "delete",  1}},
    {"rm",                    {ImpactCategory::FILE,     "delete",  1}},
    {"del",                   {ImpactCategory::FILE,     "delete",  1}},
    {"rd",                    {ImpactCategory::FILE,     "delete",  1}},
    {"rmdir",                 {ImpactCategory::FILE,     "delete",  1}},
    {"set-itemproperty",      {ImpactCategory::REGISTRY, "set",     3}},
    {"new-itemproperty",      {ImpactCategory::REGISTRY, "create",  3}},
    {"remove-itemproperty",   {ImpactCategory::REGISTRY, "delete",  5}},
    {"stop-process",          {ImpactCategory::PROCESS,  "stop",    1}},
    {"spps",                  {ImpactCategory::PROCESS,  "stop",    1}},
    {"start-process",         {ImpactCategory::PROCESS,  "start",   1}},
    {"clear-dnsclientcache",  {ImpactCategory::NETWORK,  "flush dns", 1}},
    {"netsh",                 {ImpactCategory::NETWORK,  "configure", 4}},
    {"set-dnsclientserveraddress", {ImpactCategory::NETWORK, "set dns", 4}},
    {"new-netfirewallrule",   {ImpactCategory::NETWORK,  "add firewall rule", 4}},
    {"set-netfirewallrule",   {ImpactCategory::NETWORK,  "change firewall rule", 4}},
    {"remove-netfirewallrule", {ImpactCategory::NETWORK, "remove firewall rule", 5}},
};

// Native commands whose action depends on their first argument.
const std::vector<std::string> kNativeCommands = {"sc", "sc.exe", "reg", "reg.exe", "ipconfig", "ipconfig.exe"};

std::string targetOf(const Invocation& inv) {
    auto named = parameterValues(inv, {"-name", "-path", "-literalpath", "-id", "-processname",
                                       "-displayname", "-filepath", "-interfacealias"});
    auto positional = positionalValues(inv);
    named.insert(named.end(), positional.begin(), positional.end());
    if (named.empty()) {
        return inv.piped ? "(pipeline: " + inv.pipelineSource + ")" : "(unspecified)";
    }
    std::string joined;
    for (size_t i = 0; i < named.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += named[i];
    }
    return joined;
}

void addNative(const Invocation& inv, ImpactPreview& preview) {
    if (inv.args.empty()) return;
    std::string verb = toLowerCopy(unquote(inv.args[0]));
    std::string target = inv.args.size() > 1 ? unquote(inv.args[1]) : "(unspecified)";
    const std::string& cmd = inv.command;

    if (cmd == "sc" || cmd == "sc.exe") {
        if (verb == "stop" || verb == "config" || verb == "start" || verb == "delete") {
            preview.items.push_back({ImpactCategory::SERVICE, verb, target, inv.line});
            preview.riskScore += verb == "delete" ? 10 : 2;
        }
    } else if (cmd == "reg" || cmd == "reg.exe") {
        if (verb == "add" || verb == "delete" || verb == "import") {
            preview.items.push_back({ImpactCategory::REGISTRY, verb, target, inv.line});
            preview.riskScore += verb == "add" ? 3 : 5;
        }
    } else if (verb == "/flushdns" || verb == "/release" || verb == "/renew") {
        preview.items.push_back({ImpactCategory::NETWORK, verb.substr(1), "adapter configuration", inv.line});
        preview.riskScore += verb == "/flushdns" ? 1 : 3;
    }
}

} // namespace

size_t ImpactPreview::count(ImpactCategory category) const {
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
        [category](const ImpactItem& item) { return item.category == category; }));
}

std::string ImpactPreview::summary() const {
    std::ostringstream oss;
    oss << "Impact preview: " << items.size() << " change(s), risk "
        << riskLevelToString(riskLevel) << " (score " << riskScore << ")\n";
    for (const auto& item : items) {
        oss << "  [" << impactCategoryToString(item.category) << "] " << item.action
            << " " << item.target << " (line " << item.line << ")\n";
    }
    return oss.str();
}

RiskLevel riskLevelForScore(int score) {
    if (score <= 0) return RiskLevel::NONE;
    if (score < 5) return RiskLevel::VERY_LOW;
    if (score < 10) return RiskLevel::LOW;
    if (score < 20) return RiskLevel::MEDIUM;
    if (score < 40) return RiskLevel::HIGH;
    return RiskLevel::CRITICAL;
}

ImpactPreview previewImpact(const std::string& scriptText) {
    ImpactPreview preview;
    auto lines = splitScriptLines(scriptText);

    std::vector<std::string> commands = kNativeCommands;
    for (const auto& [name, _] : kCommandImpacts) commands.push_back(name);

    for (const auto& inv : findInvocations(lines, commands)) {
        auto it = kCommandImpacts.find(inv.command);
        if (it == kCommandImpacts.end()) {
            addNative(inv, preview);
            continue;
        }

        const CommandImpact& impact = it->second;
        std::string action = impact.action;
        int weight = impact.weight;

        if (inv.command == "set-service") {
            auto startup = parameterValues(inv, {"-startuptype", "-startmode"});
            if (!startup.empty() && toLowerCopy(startup.front()) == "disabled") {
                action = "disable";
                weight = 3;
            }
        } else if (impact.category == ImpactCategory::FILE &&
                   hasSwitch(inv, {"-recurse", "-r"})) {
            action = "delete recursively";
            weight = 3;
        }

        preview.items.push_back({impact.category, action, targetOf(inv), inv.line});
        preview.riskScore += weight;
    }

    preview.riskLevel = riskLevelForScore(preview.riskScore);
    return preview;
}

} // namespace remedy
