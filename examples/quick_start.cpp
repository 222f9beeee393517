#include <chrono>
#include <iostream>
#include <procscope/procscope.hpp>
#include <thread>
#include <vector>

constexpr bool TIMING = true;

int main()
{
    std::cout << "procscope version: " << procscope::version_string() << "\n\n";

    // Sum of squares up to n, computed in a child process
    auto target = procscope::Target::from_function(
        [](const procscope::json& args, const procscope::json&)
        {
            long long n = args[0].get<long long>();
            long long total = 0;
            for (long long i = 1; i <= n; ++i)
                total += i * i;
            return total;
        },
        "sum_of_squares");

    std::vector<long long> inputs = {10, 1000, 1000000};
    std::vector<double> timings;

    for (size_t i = 0; i < inputs.size(); ++i)
    {
        procscope::ProcessOptions opts;
        opts.args = procscope::json::array({inputs[i]});

        auto start = std::chrono::high_resolution_clock::now();

        procscope::ProcessHandle process(target, opts);
        try
        {
            process.scope([](procscope::ProcessHandle& p)
                          { std::cout << "Child " << p.pid() << " started\n"; });
        }
        catch (const procscope::SpawnError& e)
        {
            std::cerr << "Error: could not fork - " << e.what() << "\n";
            return 1;
        }
        catch (const procscope::ProcscopeError& e)
        {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }

        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();
        timings.push_back(ms);

        if (process.result())
            std::cout << "sum_of_squares(" << inputs[i] << ") = " << *process.result() << "\n";
        else
            std::cout << "sum_of_squares(" << inputs[i] << ") produced no result\n";

        if (TIMING)
            std::cout << "  took " << ms << " ms\n";
    }

    // A child that runs past its scope gets terminated on the way out
    procscope::ProcessOptions opts;
    opts.terminate = true;
    procscope::ProcessHandle runaway(procscope::Target::from_function(
                                         [](const procscope::json&, const procscope::json&)
                                             -> procscope::json
                                         {
                                             while (true)
                                                 std::this_thread::sleep_for(
                                                     std::chrono::milliseconds(10));
                                         },
                                         "runaway"),
                                     opts);
    runaway.scope([](procscope::ProcessHandle&) {});

    std::cout << "\nrunaway alive after scope: " << (runaway.is_alive() ? "yes" : "no")
              << ", exit code " << runaway.exit_code().value_or(-1) << "\n";

    if (TIMING && !timings.empty())
    {
        double total = 0;
        for (double t : timings)
            total += t;
        std::cout << "Average: " << (total / timings.size()) << " ms\n";
    }

    return 0;
}
