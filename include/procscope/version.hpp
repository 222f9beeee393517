#ifndef PROCSCOPE_VERSION_HPP
#define PROCSCOPE_VERSION_HPP

#include <string>

namespace procscope
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace procscope

#endif // PROCSCOPE_VERSION_HPP
