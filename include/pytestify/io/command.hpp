#pragma once

#include <optional>
#include <string>

namespace pytestify {

// Outcome of one shell command; stdout and stderr are captured together
struct CommandResult {
    bool started = false;
    std::optional<int> exit_code;    // std::nullopt when the command did not exit normally
    std::string output;

    auto succeeded() const -> bool
    {
        return exit_code && *exit_code == 0;
    }
};

// Runs command_line through /bin/sh and waits for it
auto run_command(const std::string& command_line) -> CommandResult;

auto shell_quote(const std::string& text) -> std::string;

// Program part of a command line ("pytest -q" -> "pytest")
auto command_program(const std::string& command) -> std::string;

// Program part of a command line resolved against PATH
auto find_executable(const std::string& program) -> std::optional<std::string>;

// "exit status 3" or "exit status abnormal"
auto describe_exit(const CommandResult& result) -> std::string;

// Output without trailing blank space, cut to a length fit for one log line
auto trim_output(std::string output) -> std::string;

} // namespace pytestify
