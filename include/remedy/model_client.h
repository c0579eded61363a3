// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Transport to the diagnosis model: text in, text out.

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "remedy/config.h"
#include "remedy/export.h"
#include "remedy/types.h"

namespace remedy {

using json = nlohmann::json;

/// Abstract model call. Implementations throw TransportError on any failure.
class REMEDY_API ModelTransport {
public:
    virtual ~ModelTransport() = default;
    virtual std::string complete(const ModelRequest& request) = 0;
};

struct ModelClientConfig {
    std::string baseUrl = "http://localhost:8000/api/v1";
    std::string modelId;
    std::string apiKey;
    int connectTimeoutSeconds = 30;
    int readTimeoutSeconds = 120;
    int maxRetries = 2;            // resends of the identical payload after HTTP 429
    int retryDelaySeconds = 4;
    int maxTokens = 4096;
    bool debug = false;

    static ModelClientConfig fromConfig(const RemedyConfig& config);
};

struct Endpoint {
    bool useSSL = false;
    std::string host;
    int port = 80;
    std::string path;   // includes /chat/completions
};

/// OpenAI-compatible chat completions over cpp-httplib.
class REMEDY_API HttpModelClient : public ModelTransport {
public:
    explicit HttpModelClient(ModelClientConfig config);

    std::string complete(const ModelRequest& request) override;

    /// Split a base URL into scheme/host/port and append the completions path.
    static Endpoint parseEndpoint(const std::string& baseUrl);

    json buildRequestBody(const ModelRequest& request) const;

    /// choices[0].message.content of a response body. Throws TransportError.
    static std::string extractContent(const std::string& responseBody);

private:
    ModelClientConfig config_;
};

} // namespace remedy
