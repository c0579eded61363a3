// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Exception types raised by the pipeline.

#pragma once

#include <stdexcept>
#include <string>

namespace remedy {

/// Execution was requested for a script whose SafetyReport did not pass.
/// A defect in the caller, never a user-facing condition.
class NotValidated : public std::logic_error {
public:
    explicit NotValidated(const std::string& what) : std::logic_error(what) {}
};

/// A remediation run is already in flight in this process.
class ExecutionInProgress : public std::runtime_error {
public:
    explicit ExecutionInProgress(const std::string& what) : std::runtime_error(what) {}
};

/// The model call failed (connection, HTTP status, timeout or undecodable body).
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

/// Configuration could not be resolved.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace remedy
