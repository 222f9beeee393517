#include "log.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace procscope
{
namespace internal
{

namespace
{

void emit(const ProcessOptions& options, const std::string& line)
{
    if (options.log_callback.has_value())
    {
        (*options.log_callback)(line);
        return;
    }
    std::cerr << "[procscope] " << line << std::endl;
}

} // namespace

bool debug_enabled()
{
    const char* value = std::getenv("PROCSCOPE_DEBUG");
    return value != nullptr && value[0] != '\0' && std::string(value) != "0";
}

std::chrono::milliseconds effective_join_timeout(std::chrono::milliseconds configured)
{
    if (const char* env = std::getenv("PROCSCOPE_JOIN_TIMEOUT_MS"))
    {
        try
        {
            auto parsed = std::chrono::milliseconds(std::stol(env));
            if (parsed > configured)
                return parsed;
        }
        catch (const std::logic_error&)
        {
            // Ignore parse errors; keep configured timeout
        }
    }
    return configured;
}

void log_debug(const ProcessOptions& options, const std::string& line)
{
    if (debug_enabled())
        emit(options, line);
}

void log_warning(const ProcessOptions& options, const std::string& line)
{
    emit(options, "Warning: " + line);
}

} // namespace internal
} // namespace procscope
