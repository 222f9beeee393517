/**
 * @file error_handling.cpp
 * @brief What happens to exceptions thrown in the child
 *
 * Demonstrates:
 * - Inspecting a captured child exception without rethrowing
 * - Registering an application error type so it is rebuilt in the parent
 * - Rethrowing at scope exit with `reraise`
 * - Unregistered types arriving as ChildException
 */

#include <iostream>
#include <procscope/procscope.hpp>
#include <stdexcept>
#include <string>

using procscope::json;

struct ValidationError : std::runtime_error
{
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

struct InternalError : std::runtime_error
{
    explicit InternalError(const std::string& message) : std::runtime_error(message) {}
};

void print_scenario(const std::string& scenario)
{
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Scenario: " << scenario << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

procscope::Target validate(const std::string& input)
{
    return procscope::Target::from_function(
        [input](const json&, const json&) -> json
        {
            if (input.empty())
                throw ValidationError("input must not be empty");
            return input.size();
        },
        "validate");
}

// Example 1: the exception is captured, not rethrown
void example_captured()
{
    print_scenario("Captured Exception");

    procscope::ProcessHandle process(validate(""));
    process.scope([](procscope::ProcessHandle&) {});

    if (const auto& error = process.error())
    {
        std::cout << "kind:    " << error->kind << "\n";
        std::cout << "message: " << error->message << "\n";
        std::cout << "exit:    " << process.exit_code().value_or(-1) << "\n";
    }
}

// Example 2: registered type rethrown at scope exit
void example_reraise()
{
    print_scenario("Reraise At Scope Exit");

    procscope::register_error_type<ValidationError>();

    procscope::ProcessOptions opts;
    opts.reraise = true;

    try
    {
        procscope::ProcessHandle process(validate(""), opts);
        process.scope([](procscope::ProcessHandle&) {});
    }
    catch (const ValidationError& e)
    {
        std::cout << "caught ValidationError: " << e.what() << "\n";
    }
}

// Example 3: unregistered type
void example_unregistered()
{
    print_scenario("Unregistered Exception Type");

    procscope::ProcessOptions opts;
    opts.reraise = true;

    try
    {
        procscope::ProcessHandle process(
            procscope::Target::from_function(
                [](const json&, const json&) -> json
                {
                    try
                    {
                        throw std::out_of_range("row 12");
                    }
                    catch (const std::exception&)
                    {
                        std::throw_with_nested(InternalError("report generation failed"));
                    }
                }),
            opts);
        process.scope([](procscope::ProcessHandle&) {});
    }
    catch (const procscope::ChildException& e)
    {
        std::cout << "caught ChildException (" << e.kind() << "): " << e.what() << "\n";
        std::cout << "trace:\n" << e.trace() << "\n";
    }
}

// Example 4: misuse is reported synchronously
void example_usage_error()
{
    print_scenario("Usage Error");

    procscope::ProcessHandle process(validate("abc"));
    try
    {
        process.get();
    }
    catch (const procscope::NotAGeneratorTargetError& e)
    {
        std::cout << "NotAGeneratorTargetError: " << e.what() << "\n";
    }
}

int main()
{
    example_captured();
    example_reraise();
    example_unregistered();
    example_usage_error();
    return 0;
}
