#include "executor.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

Result<int> ProcessExecutor::run(const Invocation& invocation) {
    forge_log(fmt::format("exec [{}]: {}", invocation.working_dir,
                          format_command(invocation.program, invocation.args)));

    platform::SpawnOptions options;
    options.program = invocation.program;
    options.args = invocation.args;
    options.working_dir = invocation.working_dir;
    options.environment = invocation.environment;

    platform::ProcessHandle child = platform::spawn(options);
    if (!child.valid()) {
        forge_log("launch failed: " + child.error());
        return Result<int>::Err(make_error(ErrorKind::LaunchFailure, child.error()));
    }

    int status;
    int forwarded;
    {
        platform::SignalForwardGuard guard(child);
        status = child.wait();
        forwarded = guard.forwarded_signal();
    }

    if (forwarded != 0) {
        forge_log(fmt::format("forwarded signal {} to '{}'", forwarded, invocation.program));
    }
    forge_log(fmt::format("'{}' exited with {}", invocation.program, status));
    return Result<int>::Ok(status);
}
