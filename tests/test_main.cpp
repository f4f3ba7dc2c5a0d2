#include "test_harness.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <memory>

int main()
{
    // keep log lines out of the pass/fail report
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "tests", std::make_shared<spdlog::sinks::null_sink_mt>()));

    const auto& tests = test::registry();

    int passed = 0;
    int failed = 0;

    for (const auto& t : tests) {
        try {
            t.fn();
            std::cout << "[PASS] " << t.name << '\n';
            ++passed;
        }
        catch (const std::exception& e) {
            std::cout << "[FAIL] " << t.name << " :: " << e.what() << '\n';
            ++failed;
        }
        catch (...) {
            std::cout << "[FAIL] " << t.name << " :: unknown exception\n";
            ++failed;
        }
    }

    std::cout << "\nSummary: " << passed << " passed, " << failed
              << " failed\n";
    return failed == 0 ? 0 : 1;
}


