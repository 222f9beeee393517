#include <procscope/conversation.hpp>
#include <procscope/errors.hpp>

namespace procscope
{

Conversation::Conversation(GeneratorFunction function) : function_(std::move(function))
{
    if (!function_)
        throw NotAGeneratorTargetError("Conversations require generator functions.");
}

void Conversation::start(const json& args, const json& kwargs)
{
    std::unique_ptr<Generator> generator = function_(args, kwargs);
    if (!generator)
        throw NotAGeneratorTargetError("Generator function returned no generator");

    try
    {
        converse(*generator);
    }
    catch (...)
    {
        // Let the generator clean up, then report the original error
        std::exception_ptr error = std::current_exception();
        generator->on_error(error);

        // Values yielded before the failure still reach the parent
        child_to_parent_.close_writer();
        std::rethrow_exception(error);
    }

    child_to_parent_.flush();
}

void Conversation::converse(Generator& generator)
{
    Step step = generator.resume(json());
    while (!step.is_done())
    {
        child_to_parent_.put(step.value());
        json from_parent = parent_to_child_.get();
        step = generator.resume(from_parent);
    }
}

json Conversation::get_from_child()
{
    return child_to_parent_.get();
}

bool Conversation::send_to_child(const json& value)
{
    parent_to_child_.put(value);
    return !parent_to_child_.broken();
}

void Conversation::close_child_ends()
{
    child_to_parent_.close_writer();
    parent_to_child_.close_reader();
}

void Conversation::close_parent_ends()
{
    child_to_parent_.close_reader();
    parent_to_child_.close_writer();
}

} // namespace procscope
