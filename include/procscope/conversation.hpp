#ifndef PROCSCOPE_CONVERSATION_HPP
#define PROCSCOPE_CONVERSATION_HPP

#include <procscope/channel.hpp>
#include <procscope/types.hpp>

namespace procscope
{

/**
 * Drives a generator in a child process while the parent talks to it.
 *
 * Every value the generator yields is delivered to the parent through one
 * channel; every value the parent sends goes back into the generator through
 * another. start() runs in the child, get_from_child() and send_to_child()
 * in the parent.
 *
 * For each yield the parent must get the value and send one back, including
 * after the last yield: the generator only finishes, and the child only
 * exits, once that final value arrives.
 *
 * @code
 * // f yields 1, then the value it was sent plus one
 * procscope::Conversation conversation(f);
 * process.fork([&] { conversation.start(json::array(), json::object()); return 0; });
 *
 * conversation.get_from_child();   // 1
 * conversation.send_to_child(2);
 * conversation.get_from_child();   // 3
 * conversation.send_to_child(nullptr);
 * process.wait();
 * @endcode
 */
class Conversation
{
  public:
    explicit Conversation(GeneratorFunction function);

    // Channels are shared with a forked child; not copyable
    Conversation(const Conversation&) = delete;
    Conversation& operator=(const Conversation&) = delete;

    // Child side: run the generator to completion. Errors propagate after
    // the generator's on_error hook ran.
    void start(const json& args, const json& kwargs);

    // Parent side: oldest yielded value not delivered yet (blocks)
    json get_from_child();

    // Parent side: value for the yield the generator is (or will be) parked at.
    // Never blocks. Returns false once the child stopped reading; the value
    // is dropped then.
    bool send_to_child(const json& value);

    // After fork, in the parent: drop the ends only the child uses
    void close_child_ends();

    // After fork, in the child: drop the ends only the parent uses
    void close_parent_ends();

  private:
    void converse(Generator& generator);

    GeneratorFunction function_;
    Channel child_to_parent_;
    Channel parent_to_child_;
};

} // namespace procscope

#endif // PROCSCOPE_CONVERSATION_HPP
