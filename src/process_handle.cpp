#include "internal/log.hpp"
#include "internal/subprocess/process.hpp"

#include <procscope/process_handle.hpp>
#include <procscope/version.hpp>
#include <thread>

namespace procscope
{

namespace
{

constexpr auto JOIN_POLL_INTERVAL = std::chrono::milliseconds(5);

} // namespace

ProcessHandle::ProcessHandle(Target target, ProcessOptions options)
    : target_(std::move(target)), options_(std::move(options)),
      process_(std::make_unique<subprocess::Process>())
{
    name_ = options_.name.empty() ? target_.name() : options_.name;

    if (!options_.args.is_array())
        throw std::invalid_argument("ProcessOptions::args must be a JSON array");
    if (!options_.kwargs.is_object())
        throw std::invalid_argument("ProcessOptions::kwargs must be a JSON object");

    if (target_.is_generator())
    {
        conversation_ = std::make_unique<Conversation>(target_.generator_function());
        Conversation* conversation = conversation_.get();
        entry_ = [conversation](const json& args, const json& kwargs)
        {
            conversation->start(args, kwargs);
            return json();
        };
    }
    else
    {
        entry_ = target_.function();
    }
}

ProcessHandle::~ProcessHandle()
{
    if (!process_ || !started_)
        return;

    try
    {
        if (!process_->is_running())
            return;

        // A child parked in the conversation sees end-of-stream and gives up
        conversation_.reset();

        if (options_.daemon)
            process_->kill();
        process_->wait();
    }
    catch (const std::exception& e)
    {
        internal::log_warning(options_, "failed to reclaim " + name_ + ": " + e.what());
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&&) = default;
ProcessHandle& ProcessHandle::operator=(ProcessHandle&&) = default;

// ============================================================================
// Lifecycle
// ============================================================================

void ProcessHandle::start()
{
    if (started_)
        throw ProcessStateError(name_ + " was already started (pid " +
                                std::to_string(process_->pid()) + ")");

    subprocess::ProcessOptions proc_opts;
    proc_opts.die_with_parent = options_.daemon;

    process_->fork([this] { return run_child(); }, proc_opts);
    started_ = true;

    // Parent keeps only its own ends, so a dead child shows up as end-of-stream
    result_channel_.close_writer();
    error_channel_.close_writer();
    if (conversation_)
        conversation_->close_child_ends();

    internal::log_debug(options_, "started " + name_ + " (pid " + std::to_string(pid()) +
                                      ", procscope " + version_string() + ")");
}

int ProcessHandle::run_child()
{
    result_channel_.close_reader();
    error_channel_.close_reader();
    if (conversation_)
        conversation_->close_parent_ends();

    int code = 0;
    try
    {
        json value = entry_(options_.args, options_.kwargs);

        result_channel_.put(value);
        error_channel_.put(nullptr);
    }
    catch (...)
    {
        error_channel_.put(describe_exception(std::current_exception()).to_json());
        code = 1;
    }

    // Frames still queued when the child exits would be lost
    result_channel_.flush();
    error_channel_.flush();
    return code;
}

bool ProcessHandle::join()
{
    if (!started_)
        throw ProcessStateError("Cannot join " + name_ + ": it was never started");

    while (true)
    {
        drain_outcome();
        if (process_->try_wait().has_value())
            break;
        std::this_thread::sleep_for(JOIN_POLL_INTERVAL);
    }

    drain_outcome();
    collect_outcome();
    return true;
}

bool ProcessHandle::join(std::chrono::milliseconds timeout)
{
    if (!started_)
        throw ProcessStateError("Cannot join " + name_ + ": it was never started");

    auto start_time = std::chrono::steady_clock::now();

    bool finished = false;
    while (true)
    {
        drain_outcome();
        if (process_->try_wait().has_value())
        {
            finished = true;
            break;
        }
        if (std::chrono::steady_clock::now() - start_time >= timeout)
            break;
        std::this_thread::sleep_for(JOIN_POLL_INTERVAL);
    }

    if (!finished)
    {
        internal::log_debug(options_, name_ + " (pid " + std::to_string(pid()) +
                                          ") still running after " +
                                          std::to_string(timeout.count()) + " ms");
        return false;
    }

    drain_outcome();
    collect_outcome();
    return true;
}

void ProcessHandle::drain_outcome()
{
    if (!result_payload_)
    {
        if (auto value = result_channel_.try_get(0))
            result_payload_ = std::move(value);
    }
    if (!error_payload_)
    {
        if (auto value = error_channel_.try_get(0))
            error_payload_ = std::move(value);
    }
}

void ProcessHandle::collect_outcome()
{
    if (!outcome_collected_)
    {
        outcome_collected_ = true;

        if (error_payload_ && !error_payload_->is_null())
        {
            try
            {
                error_ = ErrorDescriptor::from_json(*error_payload_);
            }
            catch (const json::exception& e)
            {
                throw JSONDecodeError(std::string("Malformed error descriptor: ") + e.what());
            }
            exception_ = make_exception(*error_);
        }
        if (result_payload_)
            result_ = *result_payload_;

        internal::log_debug(options_, name_ + " (pid " + std::to_string(pid()) +
                                          ") exited with code " +
                                          std::to_string(exit_code().value_or(-1)) +
                                          (error_ ? " raising " + error_->kind : ""));
    }

    if (options_.reraise && exception_)
        std::rethrow_exception(exception_);
}

bool ProcessHandle::is_alive()
{
    return started_ && process_->is_running();
}

void ProcessHandle::terminate()
{
    if (!is_alive())
        return;
    internal::log_debug(options_, "terminating " + name_ + " (pid " + std::to_string(pid()) + ")");
    process_->terminate();
}

void ProcessHandle::kill()
{
    if (!is_alive())
        return;
    internal::log_debug(options_, "killing " + name_ + " (pid " + std::to_string(pid()) + ")");
    process_->kill();
}

// ============================================================================
// Conversation
// ============================================================================

Conversation& ProcessHandle::conversation(const char* what)
{
    if (!conversation_)
        throw NotAGeneratorTargetError(target_.name() + " is not a generator function" + what);
    if (!started_)
        throw ProcessStateError("Cannot talk to " + name_ + ": it was never started");
    return *conversation_;
}

json ProcessHandle::get()
{
    return conversation(" and so cannot send values back before returning.").get_from_child();
}

void ProcessHandle::send(const json& value)
{
    if (!conversation(" and so cannot receive values after starting up.").send_to_child(value))
        log_dropped_send();
}

void ProcessHandle::go()
{
    if (!conversation(". It cannot be stopped - much less go ahead after stopping.")
             .send_to_child(nullptr))
        log_dropped_send();
}

void ProcessHandle::log_dropped_send()
{
    internal::log_debug(options_, "dropped value for " + name_ + " (pid " +
                                      std::to_string(pid()) + "): child no longer reading");
}

// ============================================================================
// Scoped use
// ============================================================================

ProcessHandle& ProcessHandle::enter()
{
    start();
    return *this;
}

void ProcessHandle::exit(bool body_failed)
{
    if (body_failed || options_.terminate)
        terminate();

    auto timeout = internal::effective_join_timeout(options_.timeout);
    if (!join(timeout))
    {
        internal::log_warning(options_, name_ + " (pid " + std::to_string(pid()) +
                                            ") still running " +
                                            std::to_string(timeout.count()) +
                                            " ms after leaving its scope");
    }
}

// ============================================================================
// Accessors
// ============================================================================

std::optional<int> ProcessHandle::exit_code() const
{
    return process_ ? process_->exit_code() : std::nullopt;
}

int ProcessHandle::pid() const
{
    return process_ ? process_->pid() : 0;
}

} // namespace procscope
