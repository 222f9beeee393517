#include "frame_parser.hpp"

#include <procscope/errors.hpp>

namespace procscope
{
namespace internal
{

FrameParser::FrameParser(size_t max_buffer_size) : max_buffer_size_(max_buffer_size) {}

std::string FrameParser::encode(const json& value)
{
    return value.dump() + "\n";
}

std::vector<json> FrameParser::add_data(const std::string& data)
{
    return add_data(data.data(), data.size());
}

std::vector<json> FrameParser::add_data(const char* data, size_t size)
{
    buffer_.append(data, size);

    std::vector<json> values;

    while (auto line = extract_line())
    {
        if (line->empty())
            continue;

        try
        {
            values.push_back(json::parse(*line));
        }
        catch (const json::exception& e)
        {
            throw JSONDecodeError(std::string("Malformed frame: ") + e.what());
        }
    }

    // Whatever is left is a frame still in flight
    if (buffer_.size() > max_buffer_size_)
    {
        size_t buffered = buffer_.size();
        buffer_.clear();
        throw JSONDecodeError("Buffer exceeded maximum size of " +
                              std::to_string(max_buffer_size_) + " bytes (was " +
                              std::to_string(buffered) + ")");
    }

    return values;
}

std::optional<std::string> FrameParser::extract_line()
{
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    return line;
}

} // namespace internal
} // namespace procscope
