#include "../../src/internal/subprocess/process.hpp"
#include "../test_utils.hpp"

#include <gtest/gtest.h>
#include <procscope/conversation.hpp>
#include <procscope/errors.hpp>
#include <stdexcept>
#include <unistd.h>

using namespace procscope;

namespace
{

// Yields 1, then whatever it was sent plus one
std::unique_ptr<Generator> add_one(const json&, const json&)
{
    auto stage = std::make_shared<int>(0);
    return make_generator(
        [stage](const json& sent)
        {
            switch ((*stage)++)
            {
            case 0:
                return Step::yield(1);
            case 1:
                return Step::yield(sent.get<int>() + 1);
            default:
                return Step::done();
            }
        });
}

class RecordingGenerator : public Generator
{
  public:
    explicit RecordingGenerator(int fd) : fd_(fd) {}

    Step resume(const json&) override
    {
        throw std::runtime_error("resume failed");
    }

    void on_error(const std::exception_ptr&) override
    {
        // Reports to the test through a pipe, the only channel out of the child
        const char marker = 'x';
        if (::write(fd_, &marker, 1) != 1)
            _exit(3);
    }

  private:
    int fd_;
};

int run(Conversation& conversation)
{
    conversation.close_parent_ends();
    conversation.start(json::array(), json::object());
    return 0;
}

} // namespace

TEST(ConversationTest, RequiresGeneratorFunction)
{
    EXPECT_THROW(Conversation{GeneratorFunction()}, NotAGeneratorTargetError);
}

TEST(ConversationTest, RoundTrip)
{
    Conversation conversation(add_one);

    subprocess::Process proc;
    proc.fork([&conversation] { return run(conversation); });
    conversation.close_child_ends();

    EXPECT_EQ(conversation.get_from_child(), 1);
    conversation.send_to_child(4);
    EXPECT_EQ(conversation.get_from_child(), 5);
    conversation.send_to_child(nullptr);

    EXPECT_EQ(proc.wait(), 0);
}

TEST(ConversationTest, SendsCanRunAhead)
{
    Conversation conversation(
        [](const json&, const json&) { return test::yield_each({1, 2, 5}); });

    subprocess::Process proc;
    proc.fork([&conversation] { return run(conversation); });
    conversation.close_child_ends();

    conversation.send_to_child(nullptr);
    conversation.send_to_child(nullptr);
    conversation.send_to_child(nullptr);

    EXPECT_EQ(conversation.get_from_child(), 1);
    EXPECT_EQ(conversation.get_from_child(), 2);
    EXPECT_EQ(conversation.get_from_child(), 5);

    EXPECT_EQ(proc.wait(), 0);
    EXPECT_THROW(conversation.get_from_child(), ChannelClosedError);
}

TEST(ConversationTest, ChildWaitsForFinalSend)
{
    Conversation conversation(
        [](const json&, const json&) { return test::yield_each({1}); });

    subprocess::Process proc;
    proc.fork([&conversation] { return run(conversation); });
    conversation.close_child_ends();

    EXPECT_EQ(conversation.get_from_child(), 1);
    EXPECT_FALSE(proc.wait_for(std::chrono::milliseconds(100)).has_value());

    conversation.send_to_child(nullptr);
    EXPECT_EQ(proc.wait_for(std::chrono::milliseconds(5000)), 0);
}

TEST(ConversationTest, ArgumentsReachGenerator)
{
    Conversation conversation(
        [](const json& args, const json& kwargs)
        { return test::yield_each({args[0], kwargs["scale"]}); });

    subprocess::Process proc;
    proc.fork(
        [&conversation]
        {
            conversation.close_parent_ends();
            conversation.start(json::array({"first"}), json{{"scale", 10}});
            return 0;
        });
    conversation.close_child_ends();

    EXPECT_EQ(conversation.get_from_child(), "first");
    conversation.send_to_child(nullptr);
    EXPECT_EQ(conversation.get_from_child(), 10);
    conversation.send_to_child(nullptr);

    EXPECT_EQ(proc.wait(), 0);
}

TEST(ConversationTest, ErrorHookRunsBeforePropagation)
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    const int write_fd = fds[1];

    Conversation conversation([write_fd](const json&, const json&)
                              { return std::make_unique<RecordingGenerator>(write_fd); });

    subprocess::Process proc;
    proc.fork(
        [&conversation]
        {
            conversation.close_parent_ends();
            try
            {
                conversation.start(json::array(), json::object());
            }
            catch (const std::runtime_error&)
            {
                return 9;
            }
            return 0;
        });
    ::close(fds[1]);

    char marker = 0;
    EXPECT_EQ(::read(fds[0], &marker, 1), 1);
    EXPECT_EQ(marker, 'x');
    ::close(fds[0]);

    EXPECT_EQ(proc.wait(), 9);
}

TEST(ConversationTest, ParentGoneEndsChild)
{
    auto conversation = std::make_unique<Conversation>(
        [](const json&, const json&) { return test::yield_each({1, 2}); });

    subprocess::Process proc;
    proc.fork(
        [&conversation]
        {
            conversation->close_parent_ends();
            try
            {
                conversation->start(json::array(), json::object());
            }
            catch (const ChannelClosedError&)
            {
                return 4;
            }
            return 0;
        });
    conversation->close_child_ends();

    EXPECT_EQ(conversation->get_from_child(), 1);
    // Dropping the parent's ends leaves the child reading end-of-stream
    conversation.reset();

    EXPECT_EQ(proc.wait(), 4);
}
