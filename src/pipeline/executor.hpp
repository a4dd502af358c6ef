#pragma once

#include <string>
#include <vector>
#include <map>
#include <core/types.hpp>

// One external command: what to run, where, and with which environment.
struct Invocation {
    std::string program;
    std::vector<std::string> args;
    std::string working_dir;                           // empty = current directory
    std::map<std::string, std::string> environment;    // complete child environment
};

// Runs invocations to completion. The orchestrator only sees this
// interface, so tests can substitute a recorder.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Exit status of the finished command, or LaunchFailure when it could
    // not be started at all.
    virtual Result<int> run(const Invocation& invocation) = 0;
};

// Runs commands as child processes sharing our terminal. SIGINT and SIGTERM
// received meanwhile are passed on to the child.
class ProcessExecutor : public CommandRunner {
public:
    Result<int> run(const Invocation& invocation) override;
};
