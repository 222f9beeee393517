#ifndef PROCSCOPE_INTERNAL_LOG_HPP
#define PROCSCOPE_INTERNAL_LOG_HPP

#include <chrono>
#include <procscope/types.hpp>
#include <string>

namespace procscope
{
namespace internal
{

// PROCSCOPE_DEBUG set to anything but "" or "0"
bool debug_enabled();

// PROCSCOPE_JOIN_TIMEOUT_MS raises the scope exit timeout to at least its value
std::chrono::milliseconds effective_join_timeout(std::chrono::milliseconds configured);

// Lifecycle line, only emitted when debugging is enabled
void log_debug(const ProcessOptions& options, const std::string& line);

// Always emitted
void log_warning(const ProcessOptions& options, const std::string& line);

} // namespace internal
} // namespace procscope

#endif // PROCSCOPE_INTERNAL_LOG_HPP
