#include <procscope/errors.hpp>
#include <procscope/types.hpp>

namespace procscope
{

namespace
{

class StepGenerator : public Generator
{
  public:
    explicit StepGenerator(StepFunction step) : step_(std::move(step)) {}

    Step resume(const json& sent) override
    {
        return step_(sent);
    }

  private:
    StepFunction step_;
};

} // namespace

std::unique_ptr<Generator> make_generator(StepFunction step)
{
    if (!step)
        throw std::invalid_argument("make_generator requires a step function");
    return std::make_unique<StepGenerator>(std::move(step));
}

Target Target::from_function(Function function, std::string name)
{
    if (!function)
        throw std::invalid_argument("Target function must not be empty");

    Target target;
    target.name_ = std::move(name);
    target.function_ = std::move(function);
    return target;
}

Target Target::from_generator(GeneratorFunction function, std::string name)
{
    if (!function)
        throw NotAGeneratorTargetError("Conversations require generator functions.");

    Target target;
    target.name_ = std::move(name);
    target.generator_ = std::move(function);
    return target;
}

} // namespace procscope
