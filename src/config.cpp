// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

#include "remedy/errors.h"

namespace remedy {

using json = nlohmann::json;

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> processEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string(value);
}

int parseInt(const std::string& value, const std::string& what) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
            throw ConfigError(what + " must be a positive integer, got '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(what + " must be a positive integer, got '" + value + "'");
    }
}

bool parseBool(const std::string& value) {
    std::string v = toLower(value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

/// Read the persisted JSON config. Returns an empty object when the default file is absent.
json loadConfigFile(const std::string& path, bool mustExist) {
    std::ifstream in(path);
    if (!in) {
        if (mustExist) {
            throw ConfigError("Cannot open config file: " + path);
        }
        return json::object();
    }
    json data = json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw ConfigError("Config file is not a JSON object: " + path);
    }
    return data;
}

std::optional<std::string> fileString(const json& file, const char* key) {
    auto it = file.find(key);
    if (it == file.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<int> fileInt(const json& file, const char* key) {
    auto it = file.find(key);
    if (it == file.end()) return std::nullopt;
    if (!it->is_number_integer() || it->get<int>() <= 0) {
        throw ConfigError(std::string("Config key '") + key + "' must be a positive integer");
    }
    return it->get<int>();
}

std::optional<bool> fileBool(const json& file, const char* key) {
    auto it = file.find(key);
    if (it == file.end() || !it->is_boolean()) return std::nullopt;
    return it->get<bool>();
}

std::optional<std::vector<std::string>> fileStringList(const json& file, const char* key) {
    auto it = file.find(key);
    if (it == file.end()) return std::nullopt;
    if (!it->is_array()) {
        throw ConfigError(std::string("Config key '") + key + "' must be an array of strings");
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (item.is_string()) values.push_back(item.get<std::string>());
    }
    return values;
}

/// Apply the first present layer (explicit, environment, file) to target.
template <typename T>
void pick(ResolvedConfig& out, const std::string& key, T& target,
          const std::optional<T>& explicitValue,
          const std::optional<T>& envValue,
          const std::optional<T>& fileValue) {
    if (explicitValue) {
        target = *explicitValue;
        out.sources[key] = ConfigSource::EXPLICIT;
    } else if (envValue) {
        target = *envValue;
        out.sources[key] = ConfigSource::ENVIRONMENT;
    } else if (fileValue) {
        target = *fileValue;
        out.sources[key] = ConfigSource::FILE;
    } else {
        out.sources[key] = ConfigSource::DEFAULT;
    }
}

} // namespace

// ---- Enum helpers ----

ScanDepth parseScanDepth(const std::string& value) {
    std::string v = toLower(value);
    if (v == "quick" || v == "1") return ScanDepth::QUICK;
    if (v == "deep" || v == "2") return ScanDepth::DEEP;
    if (v == "complete" || v == "3") return ScanDepth::COMPLETE;
    throw ConfigError("Unknown scan depth '" + value + "' (expected quick, deep or complete)");
}

std::vector<std::string> categoriesForDepth(ScanDepth depth) {
    std::vector<std::string> categories = {"system", "performance"};
    if (depth == ScanDepth::QUICK) return categories;

    for (const char* c : {"network", "security", "event_logs", "bluetooth", "suspicious_processes"}) {
        categories.emplace_back(c);
    }
    if (depth == ScanDepth::DEEP) return categories;

    for (const char* c : {"disk_health", "gpu", "startup_apps"}) {
        categories.emplace_back(c);
    }
    return categories;
}

RestorePointPolicy parseRestorePointPolicy(const std::string& value) {
    std::string v = toLower(value);
    if (v == "best_effort" || v == "best-effort") return RestorePointPolicy::BEST_EFFORT;
    if (v == "required") return RestorePointPolicy::REQUIRED;
    throw ConfigError("Unknown restore point policy '" + value + "' (expected best_effort or required)");
}

std::string defaultShellExecutable() {
#ifdef _WIN32
    return "powershell";
#else
    return "pwsh";
#endif
}

std::vector<std::string> defaultEphemeralPaths() {
    return {
        "$env:TEMP",
        "$env:TMP",
        "$env:LOCALAPPDATA\\Temp",
        "$env:WINDIR\\Temp",
        "$env:SystemRoot\\Temp",
        "C:\\Windows\\Temp",
        "$env:WINDIR\\Prefetch",
        "$env:SystemRoot\\Prefetch",
        "C:\\Windows\\Prefetch",
        "$env:WINDIR\\SoftwareDistribution\\Download",
        "C:\\Windows\\SoftwareDistribution\\Download",
        "$env:WINDIR\\Logs\\CBS",
        "C:\\Windows\\Logs\\CBS",
        "$env:LOCALAPPDATA\\CrashDumps",
        "$env:LOCALAPPDATA\\Microsoft\\Windows\\INetCache",
    };
}

std::vector<std::string> RemedyConfig::effectiveCategories() const {
    if (!categories.empty()) return categories;
    return categoriesForDepth(scanDepth);
}

std::string sanitizeApiKey(const std::string& key) {
    std::string out;
    for (char c : key) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' || c == '_') {
            out += c;
        }
    }
    return out;
}

// ---- ConfigResolver ----

ConfigResolver::ConfigResolver() : env_(processEnv) {}

ResolvedConfig ConfigResolver::resolve(const ConfigOverrides& overrides) const {
    ResolvedConfig out;
    RemedyConfig& cfg = out.config;

    auto env = [this](const char* name) -> std::optional<std::string> {
        return env_ ? env_(name) : std::nullopt;
    };
    auto envInt = [&](const char* name) -> std::optional<int> {
        auto v = env(name);
        if (!v) return std::nullopt;
        return parseInt(*v, name);
    };
    auto envBool = [&](const char* name) -> std::optional<bool> {
        auto v = env(name);
        if (!v) return std::nullopt;
        return parseBool(*v);
    };

    // ---- Locate and read the persisted file ----
    json file = json::object();
    if (overrides.configFile) {
        file = loadConfigFile(*overrides.configFile, true);
        out.configFilePath = *overrides.configFile;
    } else if (auto envPath = env("REMEDY_CONFIG")) {
        file = loadConfigFile(*envPath, true);
        out.configFilePath = *envPath;
    } else {
        file = loadConfigFile("remedy.json", false);
        if (!file.empty()) out.configFilePath = "remedy.json";
    }

    // ---- Plain settings ----
    pick(out, "base_url", cfg.baseUrl, overrides.baseUrl, env("REMEDY_BASE_URL"),
         fileString(file, "base_url"));
    pick(out, "model", cfg.modelId, overrides.modelId, env("REMEDY_MODEL"),
         fileString(file, "model"));
    pick(out, "report_dir", cfg.reportDir, overrides.reportDir, env("REMEDY_REPORT_DIR"),
         fileString(file, "report_dir"));
    pick(out, "shell", cfg.shellExecutable, overrides.shellExecutable, env("REMEDY_SHELL"),
         fileString(file, "shell"));
    pick(out, "model_timeout", cfg.modelTimeoutSeconds, overrides.modelTimeoutSeconds,
         envInt("REMEDY_MODEL_TIMEOUT"), fileInt(file, "model_timeout"));
    pick(out, "execution_timeout", cfg.executionTimeoutSeconds, overrides.executionTimeoutSeconds,
         envInt("REMEDY_EXEC_TIMEOUT"), fileInt(file, "execution_timeout"));
    pick(out, "max_retries", cfg.maxTransportRetries, std::optional<int>(),
         envInt("REMEDY_MAX_RETRIES"), fileInt(file, "max_retries"));
    pick(out, "debug", cfg.debug, overrides.debug, envBool("REMEDY_DEBUG"),
         fileBool(file, "debug"));
    pick(out, "show_prompts", cfg.showPrompts, overrides.showPrompts,
         envBool("REMEDY_SHOW_PROMPTS"), fileBool(file, "show_prompts"));
    pick(out, "categories", cfg.categories, std::optional<std::vector<std::string>>(),
         std::optional<std::vector<std::string>>(), fileStringList(file, "categories"));
    pick(out, "ephemeral_paths", cfg.ephemeralPaths, std::optional<std::vector<std::string>>(),
         std::optional<std::vector<std::string>>(), fileStringList(file, "ephemeral_paths"));

    // ---- Enumerations (parsed after the winning layer is known) ----
    std::string depth = scanDepthToString(cfg.scanDepth);
    pick(out, "scan_depth", depth, overrides.scanDepth, env("REMEDY_SCAN_DEPTH"),
         fileString(file, "scan_depth"));
    cfg.scanDepth = parseScanDepth(depth);

    std::string policy = restorePointPolicyToString(cfg.restorePointPolicy);
    pick(out, "restore_point_policy", policy, overrides.restorePointPolicy,
         env("REMEDY_RESTORE_POINT_POLICY"), fileString(file, "restore_point_policy"));
    cfg.restorePointPolicy = parseRestorePointPolicy(policy);

    // ---- API key ----
    out.sources["api_key"] = ConfigSource::DEFAULT;
    if (overrides.apiKey && !sanitizeApiKey(*overrides.apiKey).empty()) {
        cfg.apiKey = sanitizeApiKey(*overrides.apiKey);
        out.sources["api_key"] = ConfigSource::EXPLICIT;
    } else if (auto envKey = env("REMEDY_API_KEY"); envKey && !sanitizeApiKey(*envKey).empty()) {
        cfg.apiKey = sanitizeApiKey(*envKey);
        out.sources["api_key"] = ConfigSource::ENVIRONMENT;
    } else {
        if (auto fileKey = fileString(file, "api_key")) {
            std::string key = sanitizeApiKey(*fileKey);
            if (key.size() >= kMinApiKeyLength) {
                cfg.apiKey = key;
                out.sources["api_key"] = ConfigSource::FILE;
            } else {
                out.notes.push_back("API key in config file is too short and was ignored");
            }
        }
        if (cfg.apiKey.empty() && overrides.requireApiKey && prompt_) {
            for (int attempt = 0; attempt < 3 && cfg.apiKey.empty(); ++attempt) {
                std::string key = sanitizeApiKey(prompt_());
                if (key.size() >= kMinApiKeyLength) {
                    cfg.apiKey = key;
                    out.sources["api_key"] = ConfigSource::PROMPT;
                } else {
                    out.notes.push_back("Entered API key is too short");
                }
            }
        }
    }
    if (overrides.requireApiKey && cfg.apiKey.empty()) {
        throw ConfigError("No usable API key: pass --api-key, set REMEDY_API_KEY, or add api_key to the config file");
    }

    return out;
}

} // namespace remedy
