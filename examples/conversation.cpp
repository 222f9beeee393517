/**
 * @file conversation.cpp
 * @brief Talking to a generator running in a child process
 *
 * The child keeps a running total. Each value the parent sends is added to it
 * and the new total is yielded back. Sending null ends the conversation.
 */

#include <iostream>
#include <procscope/procscope.hpp>
#include <vector>

using procscope::json;

namespace
{

class Accumulator : public procscope::Generator
{
  public:
    explicit Accumulator(long long start) : total_(start) {}

    procscope::Step resume(const json& sent) override
    {
        if (started_ && sent.is_null())
            return procscope::Step::done();

        if (!sent.is_null())
            total_ += sent.get<long long>();
        started_ = true;
        return procscope::Step::yield(total_);
    }

    void on_error(const std::exception_ptr&) override
    {
        std::cerr << "accumulator: giving up at total " << total_ << "\n";
    }

  private:
    long long total_;
    bool started_ = false;
};

} // namespace

int main()
{
    procscope::ProcessOptions opts;
    opts.kwargs = json{{"start", 100}};

    procscope::ProcessHandle process(
        procscope::Target::from_generator(
            [](const json&, const json& kwargs)
            { return std::make_unique<Accumulator>(kwargs.value("start", 0LL)); },
            "accumulator"),
        opts);

    std::vector<int> deltas = {1, 20, 300};

    process.scope(
        [&deltas](procscope::ProcessHandle& p)
        {
            std::cout << "initial total: " << p.get() << "\n";
            for (int delta : deltas)
            {
                p.send(delta);
                std::cout << "after +" << delta << ": " << p.get() << "\n";
            }
            // Every yield needs an answer, the last one included
            p.go();
        });

    std::cout << "child exited with code " << process.exit_code().value_or(-1) << "\n";
    return 0;
}
