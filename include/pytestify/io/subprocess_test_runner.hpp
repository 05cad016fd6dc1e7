#pragma once

#include "pytestify/interfaces.hpp"
#include <string>

namespace pytestify {

inline constexpr const char* DEFAULT_TEST_COMMAND = "pytest -q";

// Runs "<command> <file>" and reads pytest's verdict from the exit status.
// A run whose only non-passing tests are expected failures counts as passed.
class SubprocessTestRunner : public ITestRunner {
public:
    explicit SubprocessTestRunner(std::string command = DEFAULT_TEST_COMMAND);

    auto name() const -> std::string override;
    auto is_available() -> bool override;
    auto run(const std::string& path) -> TestRunOutcome override;

private:
    std::string command_;
    bool available_ = false;
};

// Last non-blank line of the output, usually pytest's "N passed" tally
auto last_output_line(const std::string& output) -> std::string;

} // namespace pytestify
