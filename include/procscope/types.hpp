#ifndef PROCSCOPE_TYPES_HPP
#define PROCSCOPE_TYPES_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace procscope
{

// Every value that crosses the process boundary is a JSON document
using json = nlohmann::json;

// ============================================================================
// Generator protocol
// ============================================================================

/// Result of resuming a generator: either a yielded value or completion.
class Step
{
  public:
    static Step yield(json value)
    {
        return Step(false, std::move(value));
    }

    static Step done()
    {
        return Step(true, json());
    }

    bool is_done() const
    {
        return done_;
    }

    const json& value() const
    {
        return value_;
    }

  private:
    Step(bool done, json value) : done_(done), value_(std::move(value)) {}

    bool done_;
    json value_;
};

/**
 * A resumable worker that produces values one step at a time.
 *
 * resume() is first called with a null value. Every later call receives the
 * value the parent process sent in answer to the previously yielded value.
 * Once resume() returns Step::done() it is never called again.
 */
class Generator
{
  public:
    virtual ~Generator() = default;

    virtual Step resume(const json& sent) = 0;

    /**
     * Called when an error is about to escape the drive loop, either thrown by
     * resume() itself or raised while talking to the parent. The generator
     * is not resumed afterwards.
     */
    virtual void on_error(const std::exception_ptr& error)
    {
        (void)error;
    }
};

using StepFunction = std::function<Step(const json& sent)>;

/// Build a generator from a step callable. The callable keeps its own state.
std::unique_ptr<Generator> make_generator(StepFunction step);

// ============================================================================
// Targets
// ============================================================================

using Function = std::function<json(const json& args, const json& kwargs)>;
using GeneratorFunction =
    std::function<std::unique_ptr<Generator>(const json& args, const json& kwargs)>;

/// The callable a ProcessHandle runs in its child process.
class Target
{
  public:
    static Target from_function(Function function, std::string name = "target");
    static Target from_generator(GeneratorFunction function, std::string name = "target");

    const std::string& name() const
    {
        return name_;
    }

    bool is_generator() const
    {
        return static_cast<bool>(generator_);
    }

    const Function& function() const
    {
        return function_;
    }

    const GeneratorFunction& generator_function() const
    {
        return generator_;
    }

  private:
    Target() = default;

    std::string name_;
    Function function_;
    GeneratorFunction generator_;
};

// ============================================================================
// Options
// ============================================================================

using LogCallback = std::function<void(const std::string&)>;

/// Process handle configuration
struct ProcessOptions
{
    // Name used in log lines; the target name when empty
    std::string name;

    // Bound at construction and handed to the target in the child
    json args = json::array();
    json kwargs = json::object();

    // How long scope exit waits for the child before giving up on waiting
    std::chrono::milliseconds timeout{1000};

    // Kill the child when the scope exits, whatever the outcome
    bool terminate = false;

    // Rethrow a captured child exception at scope exit / join
    bool reraise = false;

    // A daemon child is killed rather than waited for when its handle is
    // destroyed; on Linux it also dies together with the parent process
    bool daemon = true;

    // Receives log lines instead of std::cerr
    std::optional<LogCallback> log_callback;
};

} // namespace procscope

#endif // PROCSCOPE_TYPES_HPP
