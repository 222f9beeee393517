#include "../test_utils.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <gtest/gtest.h>
#include <procscope/procscope.hpp>
#include <signal.h>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <vector>

using namespace procscope;
using procscope::test::elapsed_ms;
using procscope::test::yield_each;

// Raised by targets in these tests; registered so the parent can rebuild it
struct AssertionError : std::logic_error
{
    explicit AssertionError(const std::string& message) : std::logic_error(message) {}
};

namespace
{

class ProcessHandleTest : public ::testing::Test
{
  protected:
    static void SetUpTestSuite()
    {
        register_error_type<AssertionError>();
    }
};

Target returns_three()
{
    return Target::from_function([](const json&, const json&) { return 3; }, "returns_three");
}

Target raises_boom()
{
    return Target::from_function(
        [](const json&, const json&) -> json { throw AssertionError("boom"); }, "raises_boom");
}

// v = yield 1; yield v + 1
Target add_one()
{
    return Target::from_generator(
        [](const json&, const json&)
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
        },
        "add_one");
}

} // namespace

// ============================================================================
// Result and exception capture
// ============================================================================

TEST_F(ProcessHandleTest, CapturesResult)
{
    ProcessHandle process(returns_three());
    process.start();
    EXPECT_TRUE(process.join());

    ASSERT_TRUE(process.result().has_value());
    EXPECT_EQ(*process.result(), 3);
    EXPECT_EQ(process.exception(), nullptr);
    EXPECT_FALSE(process.error().has_value());
    EXPECT_EQ(process.exit_code(), 0);
}

TEST_F(ProcessHandleTest, CapturesRegisteredException)
{
    ProcessHandle process(raises_boom());
    process.start();
    EXPECT_TRUE(process.join());

    EXPECT_FALSE(process.result().has_value());
    ASSERT_TRUE(process.error().has_value());
    EXPECT_EQ(process.error()->kind, "AssertionError");
    EXPECT_EQ(process.error()->message, "boom");
    EXPECT_EQ(process.exit_code(), 1);

    ASSERT_NE(process.exception(), nullptr);
    try
    {
        std::rethrow_exception(process.exception());
        FAIL() << "Expected AssertionError";
    }
    catch (const AssertionError& e)
    {
        EXPECT_STREQ(e.what(), "boom");
    }
}

TEST_F(ProcessHandleTest, UnregisteredExceptionBecomesChildException)
{
    struct LocalError : std::runtime_error
    {
        LocalError() : std::runtime_error("local failure") {}
    };

    ProcessHandle process(Target::from_function(
        [](const json&, const json&) -> json { throw LocalError(); }));
    process.start();
    process.join();

    ASSERT_NE(process.exception(), nullptr);
    EXPECT_THROW(std::rethrow_exception(process.exception()), ChildException);
    EXPECT_NE(process.error()->kind.find("LocalError"), std::string::npos);
}

TEST_F(ProcessHandleTest, ReraiseOnJoin)
{
    ProcessOptions options;
    options.reraise = true;

    ProcessHandle process(raises_boom(), options);
    process.start();
    EXPECT_THROW(process.join(), AssertionError);

    // Still rethrown on every later join
    EXPECT_THROW(process.join(), AssertionError);
}

TEST_F(ProcessHandleTest, ArgumentsReachTarget)
{
    ProcessOptions options;
    options.args = json::array({2, 5});
    options.kwargs = json{{"scale", 10}};

    ProcessHandle process(Target::from_function(
                              [](const json& args, const json& kwargs)
                              {
                                  return (args[0].get<int>() + args[1].get<int>()) *
                                         kwargs["scale"].get<int>();
                              }),
                          options);
    process.start();
    process.join();

    EXPECT_EQ(*process.result(), 70);
}

TEST_F(ProcessHandleTest, InvalidArgumentsRejected)
{
    auto construct = [](ProcessOptions options)
    { ProcessHandle process(returns_three(), std::move(options)); };

    ProcessOptions options;
    options.args = json::object();
    EXPECT_THROW(construct(options), std::invalid_argument);

    ProcessOptions kw_options;
    kw_options.kwargs = json::array();
    EXPECT_THROW(construct(kw_options), std::invalid_argument);
}

TEST_F(ProcessHandleTest, LargeResultDoesNotBlockJoin)
{
    std::string big(4 * 1024 * 1024, 'r');

    ProcessHandle process(Target::from_function([big](const json&, const json&) { return big; }));
    process.start();
    EXPECT_TRUE(process.join(std::chrono::milliseconds(10000)));

    ASSERT_TRUE(process.result().has_value());
    EXPECT_EQ(process.result()->get<std::string>().size(), big.size());
}

TEST_F(ProcessHandleTest, ChildStateIsIsolated)
{
    int counter = 0;

    ProcessHandle process(Target::from_function(
        [&counter](const json&, const json&)
        {
            counter = 100;
            return counter;
        }));
    process.start();
    process.join();

    EXPECT_EQ(*process.result(), 100);
    EXPECT_EQ(counter, 0);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ProcessHandleTest, IsAliveFollowsChild)
{
    ProcessHandle process(test::sleeping_target(std::chrono::milliseconds(200)));
    EXPECT_FALSE(process.is_alive());

    process.start();
    EXPECT_TRUE(process.is_alive());
    EXPECT_GT(process.pid(), 0);

    process.join();
    EXPECT_FALSE(process.is_alive());
}

TEST_F(ProcessHandleTest, StartTwiceFails)
{
    ProcessHandle process(returns_three());
    process.start();
    EXPECT_THROW(process.start(), ProcessStateError);
    process.join();
}

TEST_F(ProcessHandleTest, JoinBeforeStartFails)
{
    ProcessHandle process(returns_three());
    EXPECT_THROW(process.join(), ProcessStateError);
    EXPECT_THROW(process.join(std::chrono::milliseconds(10)), ProcessStateError);
}

TEST_F(ProcessHandleTest, JoinTimesOut)
{
    ProcessHandle process(test::endless_target());
    process.start();

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(process.join(std::chrono::milliseconds(100)));
    EXPECT_GE(elapsed_ms(start), 90);
    EXPECT_TRUE(process.is_alive());
    EXPECT_FALSE(process.result().has_value());

    process.kill();
    EXPECT_TRUE(process.join());
    EXPECT_EQ(process.exit_code(), 128 + SIGKILL);
}

TEST_F(ProcessHandleTest, TerminateStopsChild)
{
    ProcessHandle process(test::endless_target());
    process.start();
    process.terminate();

    EXPECT_TRUE(process.join(std::chrono::milliseconds(5000)));
    EXPECT_FALSE(process.is_alive());
    EXPECT_EQ(process.exit_code(), 128 + SIGTERM);
    EXPECT_FALSE(process.result().has_value());
    EXPECT_EQ(process.exception(), nullptr);
}

TEST_F(ProcessHandleTest, TerminateAfterExitIsNoop)
{
    ProcessHandle process(returns_three());
    process.start();
    process.join();

    process.terminate();
    process.kill();
    EXPECT_EQ(process.exit_code(), 0);
}

TEST_F(ProcessHandleTest, NameDefaultsToTarget)
{
    ProcessHandle unnamed(returns_three());
    EXPECT_EQ(unnamed.name(), "returns_three");

    ProcessOptions options;
    options.name = "worker-1";
    ProcessHandle named(returns_three(), options);
    EXPECT_EQ(named.name(), "worker-1");
}

TEST_F(ProcessHandleTest, DebugLinesGoToCallback)
{
    test::ScopedEnv env("PROCSCOPE_DEBUG", "1");

    std::vector<std::string> lines;
    ProcessOptions options;
    options.log_callback = [&lines](const std::string& line) { lines.push_back(line); };

    ProcessHandle process(returns_three(), options);
    process.start();
    process.join();

    ASSERT_GE(lines.size(), 2u);
    EXPECT_NE(lines.front().find("started returns_three"), std::string::npos);
    EXPECT_NE(lines.front().find("procscope " + version_string()), std::string::npos);
    EXPECT_NE(lines.back().find("exited with code 0"), std::string::npos);
}

TEST_F(ProcessHandleTest, DestructorKillsDaemonChild)
{
    int pid = 0;
    {
        ProcessHandle process(test::endless_target());
        process.start();
        pid = process.pid();
        ASSERT_GT(pid, 0);
    }

    // Reaped by the destructor: the pid no longer names our child
    EXPECT_NE(::kill(pid, 0), 0);
}

TEST_F(ProcessHandleTest, DestructorWarningGoesToCallback)
{
    std::vector<std::string> lines;
    {
        ProcessOptions options;
        options.log_callback = [&lines](const std::string& line) { lines.push_back(line); };

        ProcessHandle process(test::endless_target(), options);
        process.start();

        // Reaped behind the handle's back, so reclaiming it fails
        ::kill(process.pid(), SIGKILL);
        ::waitpid(process.pid(), nullptr, 0);
    }

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].rfind("Warning: failed to reclaim forever", 0), 0u);
}

TEST_F(ProcessHandleTest, DestructorWaitsForNonDaemonChild)
{
    ProcessOptions options;
    options.daemon = false;

    auto start = std::chrono::steady_clock::now();
    {
        ProcessHandle process(test::sleeping_target(std::chrono::milliseconds(200)), options);
        process.start();
    }
    EXPECT_GE(elapsed_ms(start), 150);
}

TEST_F(ProcessHandleTest, MovedHandleOwnsChild)
{
    ProcessHandle first(returns_three());
    first.start();

    ProcessHandle second(std::move(first));
    EXPECT_TRUE(second.join());
    EXPECT_EQ(*second.result(), 3);
}

// ============================================================================
// Conversation
// ============================================================================

TEST_F(ProcessHandleTest, GoAheadThenGet)
{
    ProcessHandle process(Target::from_generator(
        [](const json&, const json&) { return yield_each({1, 2, 5}); }));
    EXPECT_TRUE(process.is_generator());

    process.start();
    process.go();
    process.go();
    process.go();

    EXPECT_EQ(process.get(), 1);
    EXPECT_EQ(process.get(), 2);
    EXPECT_EQ(process.get(), 5);

    EXPECT_TRUE(process.join(std::chrono::milliseconds(5000)));
    ASSERT_TRUE(process.result().has_value());
    EXPECT_TRUE(process.result()->is_null());
    EXPECT_EQ(process.exit_code(), 0);
}

TEST_F(ProcessHandleTest, LargeValuesBothWays)
{
    const std::string big(4 * 1024 * 1024, 'b');

    ProcessHandle process(Target::from_generator(
        [big](const json&, const json&)
        {
            auto stage = std::make_shared<int>(0);
            return make_generator(
                [big, stage](const json& sent)
                {
                    if (*stage > 0 && sent.get<std::string>().size() != big.size())
                        throw std::length_error("truncated value from parent");
                    if ((*stage)++ == 2)
                        return Step::done();
                    return Step::yield(big);
                });
        }));
    process.start();

    // Both sends run ahead of the gets; neither side waits for the other
    auto sending = std::async(std::launch::async,
                              [&process, &big]
                              {
                                  process.send(big);
                                  process.send(big);
                              });
    ASSERT_EQ(sending.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    sending.get();

    EXPECT_EQ(process.get().get<std::string>().size(), big.size());
    EXPECT_EQ(process.get().get<std::string>().size(), big.size());

    EXPECT_TRUE(process.join(std::chrono::milliseconds(10000)));
    EXPECT_EQ(process.exception(), nullptr);
    EXPECT_EQ(process.exit_code(), 0);
}

TEST_F(ProcessHandleTest, SendAfterChildFailedIsDropped)
{
    test::ScopedEnv env("PROCSCOPE_DEBUG", "1");

    std::vector<std::string> lines;
    ProcessOptions options;
    options.log_callback = [&lines](const std::string& line) { lines.push_back(line); };

    ProcessHandle process(Target::from_generator(
                              [](const json&, const json&)
                              {
                                  auto started = std::make_shared<bool>(false);
                                  return make_generator(
                                      [started](const json&) -> Step
                                      {
                                          if (*started)
                                              throw AssertionError("boom");
                                          *started = true;
                                          return Step::yield(1);
                                      });
                              },
                              "fails_after_one"),
                          options);

    EXPECT_NO_THROW(process.scope(
        [](ProcessHandle& p)
        {
            p.go();
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            p.go();
            p.send(2);
        }));

    EXPECT_EQ(process.get(), 1);
    ASSERT_TRUE(process.error().has_value());
    EXPECT_EQ(process.error()->kind, "AssertionError");

    // Sends after the child is gone are dropped, not raised
    EXPECT_NO_THROW(process.go());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_NO_THROW(process.go());

    bool logged = false;
    for (const auto& line : lines)
        if (line.find("dropped value for fails_after_one") != std::string::npos)
            logged = true;
    EXPECT_TRUE(logged);
}

TEST_F(ProcessHandleTest, SendAfterChildFinishedIsDropped)
{
    ProcessHandle process(Target::from_generator(
        [](const json&, const json&) { return yield_each({7}); }));
    process.start();

    process.go();
    EXPECT_EQ(process.get(), 7);
    EXPECT_TRUE(process.join(std::chrono::milliseconds(5000)));

    EXPECT_NO_THROW(process.send("late"));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_NO_THROW(process.send("later"));
    EXPECT_NO_THROW(process.go());
}

TEST_F(ProcessHandleTest, SendRoundTrip)
{
    ProcessHandle process(add_one());
    process.start();

    EXPECT_EQ(process.get(), 1);
    process.send(2);
    EXPECT_EQ(process.get(), 3);
    process.go();

    EXPECT_TRUE(process.join(std::chrono::milliseconds(5000)));
}

TEST_F(ProcessHandleTest, MissingFinalGoLeavesChildParked)
{
    ProcessHandle process(Target::from_generator(
        [](const json&, const json&) { return yield_each({1}); }));
    process.start();

    EXPECT_EQ(process.get(), 1);
    EXPECT_FALSE(process.join(std::chrono::milliseconds(200)));
    EXPECT_TRUE(process.is_alive());

    process.kill();
    EXPECT_TRUE(process.join());
    EXPECT_EQ(process.exit_code(), 128 + SIGKILL);
}

TEST_F(ProcessHandleTest, GeneratorErrorIsCaptured)
{
    ProcessHandle process(Target::from_generator(
        [](const json&, const json&)
        {
            return make_generator([](const json&) -> Step { throw AssertionError("boom"); });
        }));
    process.start();
    process.join();

    ASSERT_TRUE(process.error().has_value());
    EXPECT_EQ(process.error()->kind, "AssertionError");
    EXPECT_EQ(process.exit_code(), 1);
}

TEST_F(ProcessHandleTest, GetAfterChildDiedThrows)
{
    ProcessHandle process(Target::from_generator(
        [](const json&, const json&) { return yield_each({}); }));
    process.start();
    process.join();

    EXPECT_THROW(process.get(), ChannelClosedError);
}

TEST_F(ProcessHandleTest, PlainTargetRejectsConversation)
{
    ProcessHandle process(returns_three());

    // Rejected before and after start, without touching the child
    EXPECT_THROW(process.get(), NotAGeneratorTargetError);
    EXPECT_THROW(process.send(1), NotAGeneratorTargetError);
    EXPECT_THROW(process.go(), NotAGeneratorTargetError);

    process.start();
    try
    {
        process.get();
        FAIL() << "Expected NotAGeneratorTargetError";
    }
    catch (const NotAGeneratorTargetError& e)
    {
        EXPECT_NE(std::string(e.what()).find("returns_three is not a generator function"),
                  std::string::npos);
    }
    process.join();
}

TEST_F(ProcessHandleTest, ConversationBeforeStartFails)
{
    ProcessHandle process(add_one());
    EXPECT_THROW(process.get(), ProcessStateError);
    EXPECT_THROW(process.send(1), ProcessStateError);
    EXPECT_THROW(process.go(), ProcessStateError);
}
