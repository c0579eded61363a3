// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/types.h"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace remedy {

// ---- TelemetrySnapshot ----

TelemetrySnapshot TelemetrySnapshot::fromJson(const json& data) {
    json categories = json::object();
    if (!data.is_object()) {
        return TelemetrySnapshot(categories);
    }

    for (auto& [name, fields] : data.items()) {
        if (!fields.is_object()) continue;

        json kept = json::object();
        for (auto& [field, value] : fields.items()) {
            if (value.is_string() || value.is_number() || value.is_boolean()) {
                kept[field] = value;
            } else if (value.is_null()) {
                kept[field] = "";
            } else {
                kept[field] = value.dump();
            }
        }
        categories[name] = std::move(kept);
    }
    return TelemetrySnapshot(std::move(categories));
}

json TelemetrySnapshot::category(const std::string& name) const {
    auto it = categories_.find(name);
    if (it == categories_.end()) return json::object();
    return *it;
}

std::vector<std::string> TelemetrySnapshot::categoryNames() const {
    std::vector<std::string> names;
    for (auto& [name, _] : categories_.items()) {
        names.push_back(name);
    }
    return names;
}

TelemetrySnapshot loadTelemetryFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open telemetry file: " + path);
    }
    json data = json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw std::runtime_error("Telemetry file is not a JSON object: " + path);
    }
    return TelemetrySnapshot::fromJson(data);
}

// ---- ExecutionResult ----

bool ExecutionResult::succeeded() const {
    if (!launched || timedOut || exitCode != 0) return false;
    return stderrText.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tmBuf{};
#ifdef _WIN32
    localtime_s(&tmBuf, &t);
#else
    localtime_r(&t, &tmBuf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

} // namespace remedy
