#include <procscope/errors.hpp>

#include <cstdlib>
#include <cxxabi.h>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>

namespace procscope
{

namespace
{

template <typename E> void add_standard(std::map<std::string, ErrorFactory>& factories)
{
    factories[type_name(typeid(E))] = [](const ErrorDescriptor& descriptor)
    { return std::make_exception_ptr(E(descriptor.message)); };
}

struct ErrorRegistry
{
    ErrorRegistry()
    {
        add_standard<std::runtime_error>(factories);
        add_standard<std::logic_error>(factories);
        add_standard<std::invalid_argument>(factories);
        add_standard<std::domain_error>(factories);
        add_standard<std::length_error>(factories);
        add_standard<std::out_of_range>(factories);
        add_standard<std::range_error>(factories);
        add_standard<std::overflow_error>(factories);
        add_standard<std::underflow_error>(factories);
    }

    std::mutex mutex;
    std::map<std::string, ErrorFactory> factories;
};

ErrorRegistry& registry()
{
    static ErrorRegistry instance;
    return instance;
}

// Walk std::nested_exception links, one line per level
void append_trace(std::ostringstream& out, const std::exception& e, int depth)
{
    if (depth > 0)
        out << "\n" << std::string(static_cast<size_t>(depth) * 2, ' ') << "caused by ";
    out << type_name(typeid(e)) << ": " << e.what();

    try
    {
        std::rethrow_if_nested(e);
    }
    catch (const std::exception& nested)
    {
        append_trace(out, nested, depth + 1);
    }
    catch (...)
    {
        out << "\n" << std::string(static_cast<size_t>(depth + 1) * 2, ' ')
            << "caused by a non-standard exception";
    }
}

} // namespace

std::string type_name(const std::type_info& type)
{
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
    if (status != 0 || !demangled)
        return type.name();
    return demangled.get();
}

ErrorDescriptor describe_exception(const std::exception_ptr& error)
{
    ErrorDescriptor descriptor;
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        descriptor.kind = type_name(typeid(e));
        descriptor.message = e.what();

        std::ostringstream trace;
        append_trace(trace, e, 0);
        descriptor.trace = trace.str();
    }
    catch (...)
    {
        descriptor.kind = "unknown";
        descriptor.message = "non-standard exception";
        descriptor.trace = "unknown: non-standard exception";
    }
    return descriptor;
}

void register_error_kind(const std::string& kind, ErrorFactory factory)
{
    auto& r = registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    r.factories[kind] = std::move(factory);
}

std::exception_ptr make_exception(const ErrorDescriptor& descriptor)
{
    ErrorFactory factory;
    {
        auto& r = registry();
        std::lock_guard<std::mutex> lock(r.mutex);
        auto it = r.factories.find(descriptor.kind);
        if (it != r.factories.end())
            factory = it->second;
    }

    if (factory)
        return factory(descriptor);
    return std::make_exception_ptr(ChildException(descriptor));
}

} // namespace procscope
