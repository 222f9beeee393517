// POSIX channel over a unix stream socket pair

#include "internal/frame_parser.hpp"

#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <poll.h>
#include <procscope/channel.hpp>
#include <procscope/errors.hpp>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace procscope
{

// ============================================================================
// ChannelState - POSIX implementation
// ============================================================================

struct ChannelState
{
    int read_fd = -1;
    int write_fd = -1;
    bool eof = false;
    internal::FrameParser parser;
    std::deque<json> pending;

    // Writer side: frames queued by put() and written by the feeder thread
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<std::string> outgoing;
    bool writing = false;  // feeder holds a frame taken off `outgoing`
    bool stopping = false; // feeder exits once `outgoing` is empty
    std::optional<std::string> write_error;
    std::unique_ptr<std::thread> feeder;
    pid_t feeder_pid = 0;

    ~ChannelState()
    {
        abandon_feeder();
        if (read_fd >= 0)
            ::close(read_fd);
        if (write_fd >= 0)
            ::close(write_fd);
    }

    void feed();
    void drain_feeder();
    void abandon_feeder();
    bool release_foreign_feeder();
};

// ============================================================================
// Helper functions
// ============================================================================

namespace
{

constexpr int SEND_BUFFER_SIZE = 1024 * 1024;

#ifdef MSG_NOSIGNAL
constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
constexpr int SEND_FLAGS = 0;
#endif

std::string get_errno_message()
{
    return std::strerror(errno);
}

// Wait until fd is readable; false on timeout
bool wait_readable(int fd, int timeout_ms)
{
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    for (;;)
    {
        int result = ::poll(&pfd, 1, timeout_ms);
        if (result >= 0)
            return result > 0;
        if (errno != EINTR)
            throw ChannelError("poll failed: " + get_errno_message());
    }
}

// Write the whole frame; an error message on failure
std::optional<std::string> write_all(int fd, const std::string& frame)
{
    const char* data = frame.data();
    size_t remaining = frame.size();

    while (remaining > 0)
    {
        ssize_t sent = ::send(fd, data, remaining, SEND_FLAGS);
        if (sent < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE || errno == ECONNRESET)
                return std::string("Broken channel (reader closed)");
            return "Write failed: " + get_errno_message();
        }
        data += sent;
        remaining -= static_cast<size_t>(sent);
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Feeder thread
// ============================================================================

void ChannelState::feed()
{
    while (true)
    {
        std::string frame;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_cv.wait(lock, [this] { return stopping || !outgoing.empty(); });
            if (outgoing.empty())
                return;
            frame = std::move(outgoing.front());
            outgoing.pop_front();
            writing = true;
        }

        auto error = write_all(write_fd, frame);

        std::lock_guard<std::mutex> lock(queue_mutex);
        writing = false;
        if (error)
        {
            // The reader is gone; nothing queued can be delivered any more
            write_error = std::move(error);
            outgoing.clear();
            queue_cv.notify_all();
            return;
        }
        queue_cv.notify_all();
    }
}

// A feeder copied across fork() has no thread behind it in this process
bool ChannelState::release_foreign_feeder()
{
    if (feeder && feeder_pid != ::getpid())
    {
        (void)feeder.release();
        return true;
    }
    return false;
}

// Let the feeder write everything queued, then stop it
void ChannelState::drain_feeder()
{
    if (!feeder || release_foreign_feeder())
        return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        stopping = true;
    }
    queue_cv.notify_all();
    if (feeder->joinable())
        feeder->join();
    feeder.reset();
}

// Stop the feeder now, dropping whatever it has not written
void ChannelState::abandon_feeder()
{
    if (!feeder || release_foreign_feeder())
        return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        stopping = true;
        outgoing.clear();
    }
    queue_cv.notify_all();

    // Wakes a feeder blocked in send() on a full buffer
    if (write_fd >= 0)
        ::shutdown(write_fd, SHUT_WR);

    if (feeder->joinable())
        feeder->join();
    feeder.reset();
}

// ============================================================================
// Channel implementation
// ============================================================================

Channel::Channel() : state_(std::make_unique<ChannelState>())
{
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0)
        throw SpawnError("Failed to create channel: " + get_errno_message(), errno);

    state_->read_fd = fds[0];
    state_->write_fd = fds[1];

    // Data only flows from fds[1] to fds[0]
    if (::shutdown(fds[0], SHUT_WR) != 0 || ::shutdown(fds[1], SHUT_RD) != 0)
        throw SpawnError("Failed to configure channel: " + get_errno_message(), errno);

    // Fewer wakeups for the feeder; best effort, the kernel default also works
    int size = SEND_BUFFER_SIZE;
    ::setsockopt(fds[1], SOL_SOCKET, SO_SNDBUF, &size, sizeof(size));
#ifdef SO_NOSIGPIPE
    int on = 1;
    ::setsockopt(fds[1], SOL_SOCKET, SO_NOSIGPIPE, &on, sizeof(on));
#endif
}

Channel::~Channel() = default;

Channel::Channel(Channel&&) noexcept = default;
Channel& Channel::operator=(Channel&&) noexcept = default;

void Channel::put(const json& value)
{
    if (!writer_open())
        throw ChannelError("Channel writer is closed");

    std::string frame = internal::FrameParser::encode(value);

    std::lock_guard<std::mutex> lock(state_->queue_mutex);
    if (state_->write_error)
        return;

    state_->outgoing.push_back(std::move(frame));

    if (!state_->feeder || state_->release_foreign_feeder())
    {
        state_->stopping = false;
        state_->feeder_pid = ::getpid();
        ChannelState* state = state_.get();
        state_->feeder = std::make_unique<std::thread>([state] { state->feed(); });
    }
    else
    {
        state_->queue_cv.notify_all();
    }
}

void Channel::flush()
{
    if (!state_)
        return;

    std::unique_lock<std::mutex> lock(state_->queue_mutex);
    if (state_->feeder && state_->feeder_pid == ::getpid())
    {
        state_->queue_cv.wait(lock,
                              [this]
                              {
                                  return state_->write_error.has_value() ||
                                         (state_->outgoing.empty() && !state_->writing);
                              });
    }

    if (state_->write_error)
        throw ChannelError(*state_->write_error);
}

bool Channel::broken() const
{
    if (!state_)
        return false;
    std::lock_guard<std::mutex> lock(state_->queue_mutex);
    return state_->write_error.has_value();
}

json Channel::get()
{
    if (!reader_open())
        throw ChannelError("Channel reader is closed");

    while (state_->pending.empty())
    {
        if (state_->eof || !fill())
            throw ChannelClosedError("Channel closed by writer");
    }

    json value = std::move(state_->pending.front());
    state_->pending.pop_front();
    return value;
}

std::optional<json> Channel::try_get(int timeout_ms)
{
    if (!reader_open())
        throw ChannelError("Channel reader is closed");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (state_->pending.empty())
    {
        if (state_->eof)
            return std::nullopt;

        int wait_ms = -1;
        if (timeout_ms >= 0)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            wait_ms = left.count() > 0 ? static_cast<int>(left.count()) : 0;
        }

        if (!wait_readable(state_->read_fd, wait_ms))
            return std::nullopt;

        if (!fill())
            return std::nullopt;
    }

    json value = std::move(state_->pending.front());
    state_->pending.pop_front();
    return value;
}

bool Channel::fill()
{
    char buffer[4096];
    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(state_->read_fd, buffer, sizeof(buffer));
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
        throw ChannelError("Read failed: " + get_errno_message());

    if (bytes_read == 0)
    {
        state_->eof = true;
        return false;
    }

    for (auto& value : state_->parser.add_data(buffer, static_cast<size_t>(bytes_read)))
        state_->pending.push_back(std::move(value));
    return true;
}

bool Channel::at_eof() const
{
    return state_ && state_->eof && state_->pending.empty();
}

void Channel::close_reader()
{
    if (state_ && state_->read_fd >= 0)
    {
        ::close(state_->read_fd);
        state_->read_fd = -1;
    }
}

void Channel::close_writer()
{
    if (state_ && state_->write_fd >= 0)
    {
        state_->drain_feeder();
        ::close(state_->write_fd);
        state_->write_fd = -1;
    }
}

bool Channel::reader_open() const
{
    return state_ && state_->read_fd >= 0;
}

bool Channel::writer_open() const
{
    return state_ && state_->write_fd >= 0;
}

} // namespace procscope
