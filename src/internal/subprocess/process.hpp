#ifndef PROCSCOPE_SUBPROCESS_PROCESS_HPP
#define PROCSCOPE_SUBPROCESS_PROCESS_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace procscope
{
namespace subprocess
{

// Forward declaration for platform-specific type
struct ProcessState;

// Process configuration
struct ProcessOptions
{
    // Deliver SIGKILL to the child when the parent dies (Linux only)
    bool die_with_parent = false;

    // Flush stdio buffers before forking so the child does not repeat them
    bool flush_stdio = true;
};

// Body run in the forked child; its return value is the exit code
using ProcessBody = std::function<int()>;

// A forked child process running a function of the parent's image
class Process
{
  public:
    Process();
    ~Process();

    // No copy, move only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Fork and run body in the child. The child never returns from this call.
    void fork(const ProcessBody& body, const ProcessOptions& options = {});

    // True between fork() and the moment the child is reaped
    bool is_running();

    std::optional<int> try_wait(); // Non-blocking wait, returns exit code if done
    int wait();                    // Blocking wait, returns exit code

    // Poll until the child exits or timeout elapses
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    void terminate(); // SIGTERM
    void kill();      // SIGKILL

    // Process ID (0 before fork)
    int pid() const;

    // Exit code once reaped: the body's return value, or 128 + signal number
    std::optional<int> exit_code() const;

  private:
    std::unique_ptr<ProcessState> handle_;
};

} // namespace subprocess
} // namespace procscope

#endif // PROCSCOPE_SUBPROCESS_PROCESS_HPP
