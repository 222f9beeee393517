#ifndef PROCSCOPE_INTERNAL_FRAME_PARSER_HPP
#define PROCSCOPE_INTERNAL_FRAME_PARSER_HPP

#include <optional>
#include <procscope/types.hpp>
#include <string>
#include <vector>

namespace procscope
{
namespace internal
{

/**
 * Incremental decoder for line-delimited JSON.
 *
 * Bytes are fed as they arrive from a channel; every complete line is decoded
 * into one value. json::dump() never emits a raw newline, so a newline always
 * terminates a frame.
 */
class FrameParser
{
  public:
    static constexpr size_t DEFAULT_MAX_BUFFER_SIZE = 64 * 1024 * 1024;

    explicit FrameParser(size_t max_buffer_size = DEFAULT_MAX_BUFFER_SIZE);

    // Encode a value as one frame (JSON + newline)
    static std::string encode(const json& value);

    // Add data to buffer and return every value completed by it
    std::vector<json> add_data(const char* data, size_t size);
    std::vector<json> add_data(const std::string& data);

    // Check if buffer holds a partial frame
    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    void clear_buffer()
    {
        buffer_.clear();
    }

  private:
    std::string buffer_;
    size_t max_buffer_size_;

    // Try to extract one complete line from buffer
    std::optional<std::string> extract_line();
};

} // namespace internal
} // namespace procscope

#endif // PROCSCOPE_INTERNAL_FRAME_PARSER_HPP
