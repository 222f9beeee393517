#ifndef PROCSCOPE_CHANNEL_HPP
#define PROCSCOPE_CHANNEL_HPP

#include <memory>
#include <optional>
#include <procscope/types.hpp>

namespace procscope
{

// Forward declaration for the platform-specific state
struct ChannelState;

/**
 * One-directional FIFO of JSON values between two processes.
 *
 * A channel is created before fork(); afterwards one process only writes and
 * the other only reads, and each closes the end it does not use. Values are
 * delivered in the order they were put.
 *
 * put() never waits for the reader. Frames are queued in memory and written
 * by a feeder thread started on the first put() in each process, so the
 * channel is unbounded whatever the kernel buffer size. A process must
 * flush() or close_writer() before it exits, or queued frames are lost.
 * Once the reader has gone, queued and later frames are dropped.
 */
class Channel
{
  public:
    Channel();
    ~Channel();

    // No copy, move only
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) noexcept;
    Channel& operator=(Channel&&) noexcept;

    // Writer side: enqueue one value. Throws ChannelError if this end is closed.
    void put(const json& value);

    // Writer side: wait until everything put so far is written.
    // Throws ChannelError if the reader went away before that.
    void flush();

    // True once a write failed because the reader went away
    bool broken() const;

    // Reader side: block until the next value arrives.
    // Throws ChannelClosedError once every writer has closed and nothing is left.
    json get();

    // Reader side: next value if one arrives within timeout_ms.
    // 0 takes only what is already readable, a negative timeout waits forever.
    std::optional<json> try_get(int timeout_ms = 0);

    // True once the reader has seen end-of-stream
    bool at_eof() const;

    void close_reader();

    // Drains queued frames first; blocks while the reader keeps them unread
    void close_writer();
    bool reader_open() const;
    bool writer_open() const;

  private:
    // Read one chunk into the parser; false on end-of-stream
    bool fill();

    std::unique_ptr<ChannelState> state_;
};

} // namespace procscope

#endif // PROCSCOPE_CHANNEL_HPP
