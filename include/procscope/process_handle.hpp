#ifndef PROCSCOPE_PROCESS_HANDLE_HPP
#define PROCSCOPE_PROCESS_HANDLE_HPP

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <procscope/channel.hpp>
#include <procscope/conversation.hpp>
#include <procscope/errors.hpp>
#include <procscope/types.hpp>
#include <string>

namespace procscope
{

namespace subprocess
{
class Process;
} // namespace subprocess

/**
 * @brief A target function running in its own child process.
 *
 * The handle forks when started and reclaims the child when joined. A plain
 * target's return value ends up in result(); an exception escaping it ends up
 * in exception() and error() instead. Nothing thrown in the child reaches the
 * parent's control flow unless `reraise` is set.
 *
 * When the target is a generator, the parent can talk to it while it runs:
 * get() returns the next yielded value and send()/go() resume it. Exactly one
 * send()/go() is needed per yield, the last one included, or the child never
 * finishes and join() waits in vain.
 *
 * @code
 * procscope::ProcessHandle process(
 *     procscope::Target::from_function([](const json&, const json&) { return 3; }));
 * process.scope([](procscope::ProcessHandle&) {
 *     // child runs here
 * });
 * process.result();   // 3
 * @endcode
 */
class ProcessHandle
{
  public:
    explicit ProcessHandle(Target target, ProcessOptions options = {});

    /**
     * @brief Reclaims a child that was never joined
     *
     * A daemon child is killed, any other child is waited for. Never throws.
     */
    ~ProcessHandle();

    // No copy, move only
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;
    ProcessHandle(ProcessHandle&&);
    ProcessHandle& operator=(ProcessHandle&&);

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Fork the child and run the target in it
     * @throws ProcessStateError if the handle was already started
     * @throws SpawnError if the process cannot be created
     */
    void start();

    /**
     * @brief Wait for the child to finish, without a time limit
     * @return true once the child terminated
     * @throws the child's exception when `reraise` is set
     */
    bool join();

    /**
     * @brief Wait at most `timeout` for the child to finish
     * @return false if the child is still running after the timeout
     * @throws the child's exception when `reraise` is set
     */
    bool join(std::chrono::milliseconds timeout);

    bool is_alive();

    // Ask the child to stop (SIGTERM); delivery is asynchronous
    void terminate();

    // Stop the child unconditionally (SIGKILL)
    void kill();

    // ========================================================================
    // Conversation
    // ========================================================================

    /**
     * @brief Next value yielded by a generator target (blocks until it arrives)
     * @throws NotAGeneratorTargetError if the target is a plain function
     */
    json get();

    /**
     * @brief Resume a generator target with `value`
     *
     * Never waits for the child. Once the child stopped reading (it finished
     * or failed) the value is dropped.
     *
     * @throws NotAGeneratorTargetError if the target is a plain function
     */
    void send(const json& value);

    /**
     * @brief Resume a generator target with null
     * @throws NotAGeneratorTargetError if the target is a plain function
     */
    void go();

    // ========================================================================
    // Scoped use
    // ========================================================================

    // Scope entry: start() and hand back the handle
    ProcessHandle& enter();

    // Scope exit: terminate if the body failed or `terminate` is set, then
    // join with the configured timeout
    void exit(bool body_failed);

    /**
     * @brief Run body(*this) between enter() and exit()
     *
     * If the body throws, the child is terminated and joined and the body's
     * exception propagates, unless joining throws first (`reraise`).
     */
    template <typename Body> void scope(Body&& body)
    {
        enter();
        try
        {
            body(*this);
        }
        catch (...)
        {
            exit(true);
            throw;
        }
        exit(false);
    }

    // ========================================================================
    // Outcome (valid after a join that saw the child terminate)
    // ========================================================================

    const std::optional<json>& result() const
    {
        return result_;
    }

    // Reconstructed child exception, or null
    std::exception_ptr exception() const
    {
        return exception_;
    }

    // Raw description of the child exception
    const std::optional<ErrorDescriptor>& error() const
    {
        return error_;
    }

    // Exit code once reaped: 0 after a result, 1 after an error,
    // 128 + signal number when killed
    std::optional<int> exit_code() const;

    int pid() const;

    const std::string& name() const
    {
        return name_;
    }

    const ProcessOptions& options() const
    {
        return options_;
    }

    bool is_generator() const
    {
        return conversation_ != nullptr;
    }

  private:
    // Supervising wrapper, runs in the child
    int run_child();

    // Move whatever the child wrote so far into the outcome buffers
    void drain_outcome();

    // Turn the drained payloads into result/exception
    void collect_outcome();

    Conversation& conversation(const char* what);

    void log_dropped_send();

    Target target_;
    ProcessOptions options_;
    std::string name_;

    // Entry point run in the child: the target itself, or the conversation
    Function entry_;
    std::unique_ptr<Conversation> conversation_;

    Channel result_channel_;
    Channel error_channel_;
    std::optional<json> result_payload_;
    std::optional<json> error_payload_;

    std::unique_ptr<subprocess::Process> process_;
    bool started_ = false;
    bool outcome_collected_ = false;

    std::optional<json> result_;
    std::optional<ErrorDescriptor> error_;
    std::exception_ptr exception_;
};

} // namespace procscope

#endif // PROCSCOPE_PROCESS_HANDLE_HPP
