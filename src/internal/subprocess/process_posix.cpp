// POSIX implementation of forked child processes
// For Linux and macOS

#include "process.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <procscope/errors.hpp>
#include <signal.h>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#ifdef __linux__
    #include <sys/prctl.h>
#endif

namespace procscope
{
namespace subprocess
{

// ============================================================================
// ProcessState - POSIX implementation
// ============================================================================

struct ProcessState
{
    pid_t pid = 0;
    bool running = false;
    std::optional<int> exit_code;
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

static constexpr auto POLL_INTERVAL = std::chrono::milliseconds(5);

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessState>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        kill();
        waitpid(handle_->pid, nullptr, 0);
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::fork(const ProcessBody& body, const ProcessOptions& options)
{
    if (handle_->pid != 0)
        throw ProcessStateError("Process already forked (pid " + std::to_string(handle_->pid) +
                                ")");

    if (options.flush_stdio)
    {
        std::cout.flush();
        std::cerr.flush();
        std::fflush(nullptr);
    }

#ifdef __linux__
    const pid_t parent_pid = getpid();
#endif

    pid_t pid = ::fork();
    if (pid < 0)
        throw SpawnError("Failed to fork process: " + get_errno_message(), errno);

    if (pid == 0)
    {
        // Child process

#ifdef __linux__
        if (options.die_with_parent)
        {
            if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0)
                _exit(127);
            // The parent may have died before prctl took effect
            if (getppid() != parent_pid)
                _exit(127);
        }
#endif

        int code = 127;
        try
        {
            code = body();
        }
        catch (const std::exception& e)
        {
            std::fprintf(stderr, "procscope: child body failed: %s\n", e.what());
        }
        catch (...)
        {
            std::fprintf(stderr, "procscope: child body failed with a non-standard exception\n");
        }

        // Never unwind into the parent's stack or run its atexit handlers
        std::cout.flush();
        std::cerr.flush();
        std::fflush(nullptr);
        _exit(code);
    }

    // Parent process
    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code.reset();
}

bool Process::is_running()
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    // Reaps the child if it already exited, so a zombie is never "running"
    return !try_wait().has_value();
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return std::nullopt;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        // Process has exited
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    else if (result == 0)
    {
        // Process is still running
        return std::nullopt;
    }
    else
    {
        throw ProcscopeError("waitpid failed: " + get_errno_message());
    }
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        throw ProcessStateError("Process was never forked");

    if (!handle_->running)
        return *handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return *handle_->exit_code;
    }

    throw ProcscopeError("waitpid failed: " + get_errno_message());
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    auto start_time = std::chrono::steady_clock::now();

    while (true)
    {
        if (auto code = try_wait())
            return code;

        if (std::chrono::steady_clock::now() - start_time >= timeout)
            return std::nullopt;

        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

std::optional<int> Process::exit_code() const
{
    if (!handle_)
        return std::nullopt;
    return handle_->exit_code;
}

} // namespace subprocess
} // namespace procscope
