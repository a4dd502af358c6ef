#include "process.hpp"
#include <core/constants.hpp>

#ifdef _WIN32
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <cerrno>
#  include <cstring>
extern char** environ;
#endif

#include <cstdio>
#include <iostream>
#include <sstream>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : error_(std::move(other.error_)) {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
#else
    pid_ = other.pid_;
    other.pid_ = -1;
#endif
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
        if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
        handle_ = other.handle_;
        thread_ = other.thread_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        other.pid_ = -1;
#endif
        error_ = std::move(other.error_);
    }
    return *this;
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

int ProcessHandle::wait() {
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return -1;
    WaitForSingleObject(handle_, INFINITE);
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    return static_cast<int>(code);
#else
    if (pid_ <= 0) return -1;
    int status = 0;
    // SignalForwardGuard installs its handlers without SA_RESTART
    while (waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            pid_ = -1;
            return -1;
        }
    }
    pid_ = -1;  // reaped
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return EXIT_SIGNAL_BASE + WTERMSIG(status);
    return -1;
#endif
}

// ── spawn ────────────────────────────────────────────────────

#ifdef _WIN32

ProcessHandle spawn(const SpawnOptions& options) {
    ProcessHandle handle;

    // Build command line
    std::ostringstream cmdline;
    cmdline << "\"" << options.program << "\"";
    for (const auto& arg : options.args) {
        cmdline << " \"" << arg << "\"";
    }
    std::string cmd_str = cmdline.str();

    // Environment block: "K=V\0K=V\0\0"
    std::string env_block;
    if (options.environment) {
        for (const auto& [key, value] : *options.environment) {
            env_block += key + "=" + value;
            env_block.push_back('\0');
        }
        env_block.push_back('\0');
    }

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    std::cout.flush();
    std::fflush(nullptr);

    if (CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE, 0,
                       options.environment ? env_block.data() : nullptr,
                       options.working_dir.empty() ? nullptr : options.working_dir.c_str(),
                       &si, &pi)) {
        handle.handle_ = pi.hProcess;
        handle.thread_ = pi.hThread;
    } else {
        handle.error_ = "failed to launch '" + options.program +
                        "' (error " + std::to_string(GetLastError()) + ")";
    }
    return handle;
}

#else // Unix

namespace {

// What the child reports through the exec pipe when it cannot start.
struct LaunchFailureReport {
    int stage;   // 0 = chdir, 1 = exec
    int err;
};

void report_and_exit(int fd, int stage, int err) {
    LaunchFailureReport report{stage, err};
    ssize_t ignored = write(fd, &report, sizeof(report));
    (void)ignored;
    _exit(127);
}

} // namespace

ProcessHandle spawn(const SpawnOptions& options) {
    ProcessHandle handle;

    // Everything the child touches is built before fork.
    std::vector<const char*> argv;
    argv.push_back(options.program.c_str());
    for (const auto& a : options.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    std::vector<char*> envp;
    if (options.environment) {
        env_strings.reserve(options.environment->size());
        for (const auto& [key, value] : *options.environment) {
            env_strings.push_back(key + "=" + value);
        }
        for (auto& s : env_strings) envp.push_back(s.data());
        envp.push_back(nullptr);
    }

    // Close-on-exec pipe: stays silent on a successful exec, carries the
    // errno back to us otherwise.
    int err_pipe[2];
    if (pipe(err_pipe) != 0) {
        handle.error_ = std::string("pipe failed: ") + std::strerror(errno);
        return handle;
    }
    fcntl(err_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

    // Don't let buffered output of ours show up after the child's
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        handle.error_ = std::string("fork failed: ") + std::strerror(errno);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return handle;
    }

    if (pid == 0) {
        // Child process
        close(err_pipe[0]);

        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            report_and_exit(err_pipe[1], 0, errno);
        }
        if (options.environment) {
            environ = envp.data();
        }

        execvp(options.program.c_str(), const_cast<char* const*>(argv.data()));
        report_and_exit(err_pipe[1], 1, errno);
    }

    // Parent
    close(err_pipe[1]);
    LaunchFailureReport report{};
    ssize_t n;
    do {
        n = read(err_pipe[0], &report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(report))) {
        waitpid(pid, nullptr, 0);
        if (report.stage == 0) {
            handle.error_ = "cannot enter working directory '" + options.working_dir +
                            "': " + std::strerror(report.err);
        } else {
            handle.error_ = "cannot execute '" + options.program + "': " +
                            std::strerror(report.err);
        }
        return handle;
    }

    handle.pid_ = pid;
    return handle;
}

#endif

// ── SignalForwardGuard ───────────────────────────────────────

#ifdef _WIN32

static volatile LONG g_forwarded_signal = 0;

// The child shares our console and receives Ctrl+C itself; we only have to
// survive it and remember that it happened.
static BOOL WINAPI ignore_console_ctrl(DWORD type) {
    if (type == CTRL_C_EVENT || type == CTRL_BREAK_EVENT) {
        InterlockedExchange(&g_forwarded_signal, 2);
        return TRUE;
    }
    return FALSE;
}

SignalForwardGuard::SignalForwardGuard(const ProcessHandle&) {
    g_forwarded_signal = 0;
    SetConsoleCtrlHandler(ignore_console_ctrl, TRUE);
}

SignalForwardGuard::~SignalForwardGuard() {
    SetConsoleCtrlHandler(ignore_console_ctrl, FALSE);
}

int SignalForwardGuard::forwarded_signal() const {
    return static_cast<int>(g_forwarded_signal);
}

#else

static volatile sig_atomic_t g_forward_pid = 0;
static volatile sig_atomic_t g_forwarded_signal = 0;

static void forward_signal(int sig) {
    g_forwarded_signal = sig;
    if (g_forward_pid > 0) {
        kill(static_cast<pid_t>(g_forward_pid), sig);
    }
}

SignalForwardGuard::SignalForwardGuard(const ProcessHandle& child) {
    g_forward_pid = child.native_handle();
    g_forwarded_signal = 0;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = forward_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &old_int_);
    sigaction(SIGTERM, &sa, &old_term_);
}

SignalForwardGuard::~SignalForwardGuard() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
    g_forward_pid = 0;
}

int SignalForwardGuard::forwarded_signal() const {
    return static_cast<int>(g_forwarded_signal);
}

#endif

} // namespace platform
