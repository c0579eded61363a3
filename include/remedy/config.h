// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Run configuration and its resolution.
// Every setting is decided once per run with the precedence
//   explicit argument > environment > persisted file > interactive prompt > default
// and passed down; nothing downstream reads the environment.

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "remedy/export.h"

namespace remedy {

enum class ScanDepth {
    QUICK,
    DEEP,
    COMPLETE
};

inline std::string scanDepthToString(ScanDepth depth) {
    switch (depth) {
        case ScanDepth::QUICK:    return "quick";
        case ScanDepth::DEEP:     return "deep";
        case ScanDepth::COMPLETE: return "complete";
    }
    return "unknown";
}

/// Parse "quick"/"deep"/"complete" (or "1"/"2"/"3"). Throws ConfigError otherwise.
REMEDY_API ScanDepth parseScanDepth(const std::string& value);

/// Telemetry categories included in the prompt for a scan depth.
REMEDY_API std::vector<std::string> categoriesForDepth(ScanDepth depth);

enum class RestorePointPolicy {
    BEST_EFFORT,  // failure is recorded, execution continues
    REQUIRED      // failure prevents the script from starting
};

inline std::string restorePointPolicyToString(RestorePointPolicy policy) {
    switch (policy) {
        case RestorePointPolicy::BEST_EFFORT: return "best_effort";
        case RestorePointPolicy::REQUIRED:    return "required";
    }
    return "unknown";
}

/// Parse "best_effort"/"required". Throws ConfigError otherwise.
REMEDY_API RestorePointPolicy parseRestorePointPolicy(const std::string& value);

/// Default PowerShell executable for the host platform.
REMEDY_API std::string defaultShellExecutable();

/// Directories where recursive or wildcard deletes are allowed.
REMEDY_API std::vector<std::string> defaultEphemeralPaths();

struct RemedyConfig {
    // Model endpoint (OpenAI-compatible)
    std::string baseUrl = "http://localhost:8000/api/v1";
    std::string modelId = "Qwen3-4B-GGUF";
    std::string apiKey;                    // never logged or persisted
    int connectTimeoutSeconds = 30;
    int modelTimeoutSeconds = 120;
    int maxTransportRetries = 2;
    int maxTokens = 4096;

    // Prompt
    ScanDepth scanDepth = ScanDepth::COMPLETE;
    std::vector<std::string> categories;   // empty = derived from scanDepth
    size_t maxFieldChars = 2000;

    // Execution
    std::string shellExecutable = defaultShellExecutable();
    int executionTimeoutSeconds = 300;
    int restorePointTimeoutSeconds = 120;
    RestorePointPolicy restorePointPolicy = RestorePointPolicy::BEST_EFFORT;
    std::vector<std::string> ephemeralPaths = defaultEphemeralPaths();

    // Output
    std::string reportDir = "diagnostic_reports";
    bool debug = false;
    bool showPrompts = false;
    bool silentMode = false;

    /// Categories actually sent: the explicit list if set, otherwise the depth's list.
    std::vector<std::string> effectiveCategories() const;
};

enum class ConfigSource {
    DEFAULT,
    PROMPT,
    FILE,
    ENVIRONMENT,
    EXPLICIT
};

inline std::string configSourceToString(ConfigSource source) {
    switch (source) {
        case ConfigSource::DEFAULT:     return "default";
        case ConfigSource::PROMPT:      return "prompt";
        case ConfigSource::FILE:        return "file";
        case ConfigSource::ENVIRONMENT: return "environment";
        case ConfigSource::EXPLICIT:    return "argument";
    }
    return "unknown";
}

/// Values given explicitly on the command line.
struct ConfigOverrides {
    std::optional<std::string> configFile;
    std::optional<std::string> baseUrl;
    std::optional<std::string> modelId;
    std::optional<std::string> apiKey;
    std::optional<std::string> scanDepth;
    std::optional<std::string> restorePointPolicy;
    std::optional<std::string> reportDir;
    std::optional<std::string> shellExecutable;
    std::optional<int> modelTimeoutSeconds;
    std::optional<int> executionTimeoutSeconds;
    std::optional<bool> debug;
    std::optional<bool> showPrompts;
    bool requireApiKey = false;   // ask interactively when no other source has a key
};

struct ResolvedConfig {
    RemedyConfig config;
    std::map<std::string, ConfigSource> sources;
    std::optional<std::string> configFilePath;   // file actually read, if any
    std::vector<std::string> notes;              // recoverable problems met while resolving
};

/// Keep only [A-Za-z0-9._-] characters.
REMEDY_API std::string sanitizeApiKey(const std::string& key);

/// A usable key is at least this long after sanitizing.
constexpr size_t kMinApiKeyLength = 30;

class REMEDY_API ConfigResolver {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
    using KeyPrompt = std::function<std::string()>;

    /// Uses the process environment and no interactive prompt.
    ConfigResolver();

    void setEnvironment(EnvLookup lookup) { env_ = std::move(lookup); }
    void setKeyPrompt(KeyPrompt prompt) { prompt_ = std::move(prompt); }

    /// Resolve every setting. Throws ConfigError on fatal problems.
    ResolvedConfig resolve(const ConfigOverrides& overrides) const;

private:
    EnvLookup env_;
    KeyPrompt prompt_;
};

} // namespace remedy
