#include "pytestify/io/command.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace pytestify {

auto run_command(const std::string& command_line) -> CommandResult {
    CommandResult result;
    auto redirected = command_line + " 2>&1";
    FILE* pipe = popen(redirected.c_str(), "r");
    if (pipe == nullptr) {
        return result;
    }
    result.started = true;

    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output += buffer;
    }
    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

auto shell_quote(const std::string& text) -> std::string {
    std::string quoted = "'";
    for (char ch : text) {
        quoted += ch == '\'' ? std::string("'\\''") : std::string(1, ch);
    }
    return quoted + "'";
}

auto command_program(const std::string& command) -> std::string {
    std::istringstream words(command);
    std::string word;
    words >> word;
    return word;
}

auto find_executable(const std::string& program) -> std::optional<std::string> {
    if (program.empty()) {
        return std::nullopt;
    }
    if (program.find('/') != std::string::npos) {
        if (access(program.c_str(), X_OK) == 0) {
            return program;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }
    std::istringstream directories(path_env);
    std::string directory;
    while (std::getline(directories, directory, ':')) {
        auto candidate =
            (std::filesystem::path(directory.empty() ? "." : directory) / program).string();
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto describe_exit(const CommandResult& result) -> std::string {
    return "exit status " + (result.exit_code ? std::to_string(*result.exit_code)
                                              : std::string("abnormal"));
}

auto trim_output(std::string output) -> std::string {
    while (!output.empty() && (output.back() == '\n' || output.back() == ' ')) {
        output.pop_back();
    }
    constexpr size_t limit = 400;
    if (output.size() > limit) {
        output = output.substr(0, limit) + " ...";
    }
    return output;
}

} // namespace pytestify
