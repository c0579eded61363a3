// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Runs a command in a fresh child process and captures its output.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "remedy/export.h"

namespace remedy {

struct ProcessOutput {
    bool launched = false;
    std::string launchError;
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
    bool timedOut = false;
};

/// Abstract process runner. Tests substitute fakes.
class REMEDY_API ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /// Run argv[0] with the remaining arguments, stdin closed, stdout and stderr
    /// captured separately. A child still running after timeoutSeconds is killed.
    virtual ProcessOutput run(const std::vector<std::string>& argv, int timeoutSeconds) = 0;
};

/// Real child processes: fork/execvp on POSIX, CreateProcess on Windows.
class REMEDY_API SubprocessRunner : public ProcessRunner {
public:
    ProcessOutput run(const std::vector<std::string>& argv, int timeoutSeconds) override;

private:
    struct Impl;
};

} // namespace remedy
