#include <procscope/version.hpp>
#include <sstream>

namespace procscope
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH;
    return oss.str();
}

} // namespace procscope
