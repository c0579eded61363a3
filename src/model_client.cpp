// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/model_client.h"

#include <chrono>
#include <iostream>
#include <thread>

#include <httplib.h>

#include "remedy/errors.h"

namespace remedy {

ModelClientConfig ModelClientConfig::fromConfig(const RemedyConfig& config) {
    ModelClientConfig c;
    c.baseUrl = config.baseUrl;
    c.modelId = config.modelId;
    c.apiKey = config.apiKey;
    c.connectTimeoutSeconds = config.connectTimeoutSeconds;
    c.readTimeoutSeconds = config.modelTimeoutSeconds;
    c.maxRetries = config.maxTransportRetries;
    c.maxTokens = config.maxTokens;
    c.debug = config.debug;
    return c;
}

HttpModelClient::HttpModelClient(ModelClientConfig config) : config_(std::move(config)) {}

Endpoint HttpModelClient::parseEndpoint(const std::string& baseUrl) {
    Endpoint ep;
    std::string rest = baseUrl;

    if (rest.substr(0, 8) == "https://") {
        ep.useSSL = true;
        ep.port = 443;
        rest = rest.substr(8);
    } else if (rest.substr(0, 7) == "http://") {
        rest = rest.substr(7);
    }

    auto slashPos = rest.find('/');
    if (slashPos != std::string::npos) {
        ep.host = rest.substr(0, slashPos);
        ep.path = rest.substr(slashPos);
    } else {
        ep.host = rest;
    }

    auto colonPos = ep.host.find(':');
    if (colonPos != std::string::npos) {
        try {
            ep.port = std::stoi(ep.host.substr(colonPos + 1));
        } catch (const std::logic_error&) {
            throw ConfigError("Invalid port in model URL: " + baseUrl);
        }
        ep.host = ep.host.substr(0, colonPos);
    }
    if (ep.host.empty()) {
        throw ConfigError("Model URL has no host: " + baseUrl);
    }

    if (ep.path.empty() || ep.path.back() != '/') {
        ep.path += "/chat/completions";
    } else {
        ep.path += "chat/completions";
    }
    return ep;
}

json HttpModelClient::buildRequestBody(const ModelRequest& request) const {
    json body;
    body["model"] = config_.modelId;
    body["max_tokens"] = config_.maxTokens;
    body["messages"] = json::array({{{"role", "user"}, {"content", request.text}}});
    return body;
}

std::string HttpModelClient::extractContent(const std::string& responseBody) {
    json response = json::parse(responseBody, nullptr, false);
    if (response.is_discarded()) {
        throw TransportError("Model response is not valid JSON");
    }
    try {
        if (response.is_object() && response.contains("choices") && response["choices"].is_array() &&
            !response["choices"].empty() && response["choices"][0].is_object()) {
            const auto& choice = response["choices"][0];
            if (choice.contains("message") && choice["message"].is_object()) {
                const auto& message = choice["message"];
                if (message.contains("content") && message["content"].is_string()) {
                    return message["content"].get<std::string>();
                }
                // Some servers return null content for an empty completion
                if (!message.contains("content") || message["content"].is_null()) {
                    return "";
                }
            }
        }
    } catch (const json::exception& e) {
        throw TransportError(std::string("Unexpected model response format: ") + e.what());
    }
    throw TransportError("Unexpected model response format: " +
                         response.dump(-1, ' ', false, json::error_handler_t::replace).substr(0, 200));
}

std::string HttpModelClient::complete(const ModelRequest& request) {
    Endpoint ep = parseEndpoint(config_.baseUrl);
    std::string payload = buildRequestBody(request).dump(-1, ' ', false, json::error_handler_t::replace);

    httplib::Headers headers;
    if (!config_.apiKey.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.apiKey);
    }

    if (config_.debug) {
        std::cerr << "[LLM] Calling " << ep.host << ":" << ep.port << ep.path << std::endl;
        std::cerr << "[LLM] Payload: " << payload.size() << " bytes" << std::endl;
    }

    auto send = [&](auto& cli) -> std::string {
        cli.set_connection_timeout(config_.connectTimeoutSeconds);
        cli.set_read_timeout(config_.readTimeoutSeconds);
        cli.set_write_timeout(config_.readTimeoutSeconds);

        for (int attempt = 0;; ++attempt) {
            auto res = cli.Post(ep.path, headers, payload, "application/json");
            if (!res) {
                throw TransportError("Model request failed: " + httplib::to_string(res.error()) +
                                     " (" + ep.host + ":" + std::to_string(ep.port) + ")");
            }
            if (res->status == 429 && attempt < config_.maxRetries) {
                if (config_.debug) {
                    std::cerr << "[LLM] Rate limited, resending in " << config_.retryDelaySeconds
                              << "s" << std::endl;
                }
                std::this_thread::sleep_for(std::chrono::seconds(config_.retryDelaySeconds));
                continue;
            }
            if (res->status != 200) {
                throw TransportError("Model request failed with status " +
                                     std::to_string(res->status) + ": " + res->body.substr(0, 500));
            }
            return res->body;
        }
    };

    std::string responseBody;
    if (ep.useSSL) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        httplib::SSLClient cli(ep.host, ep.port);
        responseBody = send(cli);
#else
        throw TransportError("SSL not supported in this build. Use an http:// base URL.");
#endif
    } else {
        httplib::Client cli(ep.host, ep.port);
        responseBody = send(cli);
    }

    if (config_.debug) {
        std::cerr << "[LLM] Response: " << responseBody.size() << " bytes" << std::endl;
    }
    return extractContent(responseBody);
}

} // namespace remedy
