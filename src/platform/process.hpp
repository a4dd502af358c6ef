#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <signal.h>
#endif

namespace platform {

struct SpawnOptions {
    std::string program;                 // resolved through PATH when it has no slash
    std::vector<std::string> args;
    std::string working_dir;             // empty = inherit
    // Full child environment. nullopt = inherit ours unchanged.
    std::optional<std::map<std::string, std::string>> environment;
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Why the spawn failed (empty when valid).
    const std::string& error() const { return error_; }

    // Block until the process exits. Returns its exit status, or
    // 128 + N when it was killed by signal N. -1 on an invalid handle.
    int wait();

    // Get the raw pid/handle.
#ifdef _WIN32
    HANDLE native_handle() const { return handle_; }
#else
    int native_handle() const { return pid_; }
#endif

private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
#endif
    std::string error_;
    friend ProcessHandle spawn(const SpawnOptions& options);
};

// Spawn a child process that shares our stdin/stdout/stderr.
// A child that cannot be started (missing program, bad working directory)
// yields an invalid handle whose error() says why.
ProcessHandle spawn(const SpawnOptions& options);

// RAII guard that forwards SIGINT/SIGTERM to a running child instead of
// letting them terminate us. The previous handlers are restored on exit.
class SignalForwardGuard {
public:
    explicit SignalForwardGuard(const ProcessHandle& child);
    ~SignalForwardGuard();

    SignalForwardGuard(const SignalForwardGuard&) = delete;
    SignalForwardGuard& operator=(const SignalForwardGuard&) = delete;

    // Signal forwarded while this guard was active (0 = none).
    int forwarded_signal() const;

private:
#ifndef _WIN32
    struct sigaction old_int_;
    struct sigaction old_term_;
#endif
};

} // namespace platform
