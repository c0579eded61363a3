// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "remedy/process_runner.h"

#include <chrono>
#include <cstring>
#include <functional>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace remedy {

#ifdef _WIN32

namespace {

std::string quoteArg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) return arg;
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

void drainPipe(HANDLE pipe, std::string& sink) {
    char buffer[4096];
    DWORD bytesRead = 0;
    while (ReadFile(pipe, buffer, sizeof(buffer), &bytesRead, nullptr) && bytesRead > 0) {
        sink.append(buffer, bytesRead);
    }
}

} // namespace

struct SubprocessRunner::Impl {
    HANDLE stdoutRead = INVALID_HANDLE_VALUE;
    HANDLE stderrRead = INVALID_HANDLE_VALUE;
    PROCESS_INFORMATION procInfo = {};
    bool running = false;

    ~Impl() {
        cleanup();
    }

    void cleanup() {
        if (running) {
            TerminateProcess(procInfo.hProcess, 1);
            WaitForSingleObject(procInfo.hProcess, 5000);
        }
        if (procInfo.hProcess) { CloseHandle(procInfo.hProcess); procInfo.hProcess = nullptr; }
        if (procInfo.hThread) { CloseHandle(procInfo.hThread); procInfo.hThread = nullptr; }
        if (stdoutRead != INVALID_HANDLE_VALUE) { CloseHandle(stdoutRead); stdoutRead = INVALID_HANDLE_VALUE; }
        if (stderrRead != INVALID_HANDLE_VALUE) { CloseHandle(stderrRead); stderrRead = INVALID_HANDLE_VALUE; }
        running = false;
    }

    bool launch(const std::vector<std::string>& argv, std::string& error) {
        SECURITY_ATTRIBUTES sa;
        sa.nLength = sizeof(SECURITY_ATTRIBUTES);
        sa.bInheritHandle = TRUE;
        sa.lpSecurityDescriptor = nullptr;

        HANDLE stdoutWrite, stderrWrite;
        if (!CreatePipe(&stdoutRead, &stdoutWrite, &sa, 0)) {
            error = "CreatePipe failed";
            return false;
        }
        SetHandleInformation(stdoutRead, HANDLE_FLAG_INHERIT, 0);
        if (!CreatePipe(&stderrRead, &stderrWrite, &sa, 0)) {
            CloseHandle(stdoutWrite);
            error = "CreatePipe failed";
            return false;
        }
        SetHandleInformation(stderrRead, HANDLE_FLAG_INHERIT, 0);

        STARTUPINFOA si = {};
        si.cb = sizeof(si);
        si.hStdInput = INVALID_HANDLE_VALUE;
        si.hStdOutput = stdoutWrite;
        si.hStdError = stderrWrite;
        si.dwFlags |= STARTF_USESTDHANDLES;

        std::string cmdLine;
        for (const auto& arg : argv) {
            if (!cmdLine.empty()) cmdLine += ' ';
            cmdLine += quoteArg(arg);
        }

        BOOL ok = CreateProcessA(
            nullptr,
            cmdLine.data(),
            nullptr, nullptr,
            TRUE, CREATE_NO_WINDOW,
            nullptr, nullptr,
            &si, &procInfo
        );

        CloseHandle(stdoutWrite);
        CloseHandle(stderrWrite);

        if (!ok) {
            error = "CreateProcess failed with error " + std::to_string(GetLastError());
            return false;
        }
        running = true;
        return true;
    }

    void collect(int timeoutSeconds, ProcessOutput& out) {
        std::thread outReader(drainPipe, stdoutRead, std::ref(out.stdoutText));
        std::thread errReader(drainPipe, stderrRead, std::ref(out.stderrText));

        DWORD wait = WaitForSingleObject(procInfo.hProcess,
                                         static_cast<DWORD>(timeoutSeconds) * 1000);
        if (wait == WAIT_TIMEOUT) {
            out.timedOut = true;
            TerminateProcess(procInfo.hProcess, 1);
            WaitForSingleObject(procInfo.hProcess, 5000);
        }
        outReader.join();
        errReader.join();

        DWORD exitCode = 1;
        GetExitCodeProcess(procInfo.hProcess, &exitCode);
        out.exitCode = static_cast<int>(exitCode);
        running = false;
    }
};

#else // POSIX

struct SubprocessRunner::Impl {
    pid_t pid = -1;
    int stdoutFd = -1;
    int stderrFd = -1;
    bool running = false;

    ~Impl() {
        cleanup();
    }

    void cleanup() {
        if (stdoutFd >= 0) { close(stdoutFd); stdoutFd = -1; }
        if (stderrFd >= 0) { close(stderrFd); stderrFd = -1; }
        if (running && pid > 0) {
            kill(pid, SIGKILL);
            int status;
            waitpid(pid, &status, 0);
            running = false;
        }
    }

    bool launch(const std::vector<std::string>& argv, std::string& error) {
        int outPipe[2], errPipe[2];
        if (pipe(outPipe) != 0) {
            error = std::string("pipe failed: ") + std::strerror(errno);
            return false;
        }
        if (pipe(errPipe) != 0) {
            error = std::string("pipe failed: ") + std::strerror(errno);
            close(outPipe[0]); close(outPipe[1]);
            return false;
        }

        std::vector<char*> args;
        for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
        args.push_back(nullptr);

        pid = fork();
        if (pid < 0) {
            error = std::string("fork failed: ") + std::strerror(errno);
            close(outPipe[0]); close(outPipe[1]);
            close(errPipe[0]); close(errPipe[1]);
            return false;
        }

        if (pid == 0) {
            // Child
            int devNull = open("/dev/null", O_RDONLY);
            if (devNull >= 0) {
                dup2(devNull, STDIN_FILENO);
                close(devNull);
            }
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(errPipe[1], STDERR_FILENO);
            close(outPipe[0]); close(outPipe[1]);
            close(errPipe[0]); close(errPipe[1]);

            execvp(args[0], args.data());
            const char msg[] = "failed to start process\n";
            ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            _exit(127);
        }

        // Parent
        close(outPipe[1]);
        close(errPipe[1]);
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        running = true;
        return true;
    }

    void collect(int timeoutSeconds, ProcessOutput& out) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSeconds);
        char buffer[4096];

        while (stdoutFd >= 0 || stderrFd >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                out.timedOut = true;
                kill(pid, SIGKILL);
                break;
            }

            fd_set readFds;
            FD_ZERO(&readFds);
            int maxFd = -1;
            if (stdoutFd >= 0) { FD_SET(stdoutFd, &readFds); maxFd = stdoutFd; }
            if (stderrFd >= 0) { FD_SET(stderrFd, &readFds); if (stderrFd > maxFd) maxFd = stderrFd; }

            struct timeval tv;
            tv.tv_sec = static_cast<long>(remaining / 1000);
            tv.tv_usec = static_cast<long>((remaining % 1000) * 1000);

            int ready = select(maxFd + 1, &readFds, nullptr, nullptr, &tv);
            if (ready < 0) {
                if (errno == EINTR) continue;
                break;
            }

            for (int* fd : {&stdoutFd, &stderrFd}) {
                if (*fd < 0 || !FD_ISSET(*fd, &readFds)) continue;
                ssize_t n = read(*fd, buffer, sizeof(buffer));
                if (n > 0) {
                    (fd == &stdoutFd ? out.stdoutText : out.stderrText).append(buffer, static_cast<size_t>(n));
                } else {
                    close(*fd);
                    *fd = -1;
                }
            }
        }

        int status = 0;
        waitpid(pid, &status, 0);
        running = false;
        if (WIFEXITED(status)) {
            out.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            out.exitCode = 128 + WTERMSIG(status);
        }
    }
};

#endif

ProcessOutput SubprocessRunner::run(const std::vector<std::string>& argv, int timeoutSeconds) {
    ProcessOutput out;
    if (argv.empty()) {
        out.launchError = "empty command line";
        return out;
    }

    Impl impl;
    if (!impl.launch(argv, out.launchError)) {
        return out;
    }
    out.launched = true;
    impl.collect(timeoutSeconds, out);
    return out;
}

} // namespace remedy
