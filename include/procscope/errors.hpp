#ifndef PROCSCOPE_ERRORS_HPP
#define PROCSCOPE_ERRORS_HPP

#include <exception>
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <typeinfo>

namespace procscope
{

// Base exception
class ProcscopeError : public std::runtime_error
{
  public:
    explicit ProcscopeError(const std::string& message) : std::runtime_error(message) {}
};

// get/send/go on a handle whose target does not yield
class NotAGeneratorTargetError : public ProcscopeError
{
  public:
    explicit NotAGeneratorTargetError(const std::string& message) : ProcscopeError(message) {}
};

// Handle used out of order (started twice, conversed with before start)
class ProcessStateError : public ProcscopeError
{
  public:
    explicit ProcessStateError(const std::string& message) : ProcscopeError(message) {}
};

// fork/socketpair failure
class SpawnError : public ProcscopeError
{
  public:
    SpawnError(const std::string& message, int error_code)
        : ProcscopeError(message), error_code_(error_code)
    {
    }

    int error_code() const
    {
        return error_code_;
    }

  private:
    int error_code_;
};

// Channel I/O failure
class ChannelError : public ProcscopeError
{
  public:
    explicit ChannelError(const std::string& message) : ProcscopeError(message) {}
};

// Every writer of a channel is gone and nothing is left to read
class ChannelClosedError : public ChannelError
{
  public:
    explicit ChannelClosedError(const std::string& message) : ChannelError(message) {}
};

// JSON decode error
class JSONDecodeError : public ProcscopeError
{
  public:
    explicit JSONDecodeError(const std::string& message) : ProcscopeError(message) {}
};

// ============================================================================
// Cross-process error transport
// ============================================================================

/// Serializable form of an exception that escaped the child's target.
struct ErrorDescriptor
{
    std::string kind;    // Demangled type name, e.g. "std::logic_error"
    std::string message; // what()
    std::string trace;   // Nested exception chain, outermost first

    nlohmann::json to_json() const
    {
        return nlohmann::json{{"kind", kind}, {"message", message}, {"trace", trace}};
    }

    static ErrorDescriptor from_json(const nlohmann::json& j)
    {
        return ErrorDescriptor{j.at("kind").get<std::string>(),
                               j.at("message").get<std::string>(),
                               j.value("trace", std::string())};
    }
};

// Child error whose kind has no registered factory
class ChildException : public ProcscopeError
{
  public:
    explicit ChildException(const ErrorDescriptor& descriptor)
        : ProcscopeError(descriptor.message), descriptor_(descriptor)
    {
    }

    const std::string& kind() const
    {
        return descriptor_.kind;
    }

    const std::string& trace() const
    {
        return descriptor_.trace;
    }

    const ErrorDescriptor& descriptor() const
    {
        return descriptor_;
    }

  private:
    ErrorDescriptor descriptor_;
};

using ErrorFactory = std::function<std::exception_ptr(const ErrorDescriptor&)>;

/// Demangled name of a type, as used for ErrorDescriptor::kind
std::string type_name(const std::type_info& type);

/// Describe an in-flight exception. Non-std::exception objects get kind "unknown".
ErrorDescriptor describe_exception(const std::exception_ptr& error);

/// Map an error kind to the exception the parent should see for it.
void register_error_kind(const std::string& kind, ErrorFactory factory);

/// Register E (constructible from a message string) under its own type name.
template <typename E> void register_error_type()
{
    register_error_kind(type_name(typeid(E)), [](const ErrorDescriptor& descriptor)
                        { return std::make_exception_ptr(E(descriptor.message)); });
}

/// Rebuild an exception from its descriptor; ChildException for unknown kinds.
std::exception_ptr make_exception(const ErrorDescriptor& descriptor);

} // namespace procscope

#endif // PROCSCOPE_ERRORS_HPP
