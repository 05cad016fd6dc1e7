#include "pytestify/io/subprocess_assertion_converter.hpp"
#include "pytestify/io/file_system.hpp"
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace pytestify {

namespace fs = std::filesystem;

namespace {

// Unique temporary .py file, removed when the object goes away
class TemporaryFile {
public:
    TemporaryFile() {
        auto pattern = (fs::temp_directory_path() / "pytestify-XXXXXX.py").string();
        int fd = mkstemps(pattern.data(), 3);
        if (fd >= 0) {
            close(fd);
            path_ = pattern;
        }
    }

    ~TemporaryFile() {
        if (!path_.empty()) {
            std::error_code ignored;
            fs::remove(path_, ignored);
        }
    }

    TemporaryFile(const TemporaryFile&) = delete;
    auto operator=(const TemporaryFile&) -> TemporaryFile& = delete;

    auto path() const -> const std::string&
    {
        return path_;
    }

private:
    std::string path_;
};

} // namespace

SubprocessAssertionConverter::SubprocessAssertionConverter(std::string command)
    : command_(std::move(command))
    , available_(find_executable(command_program(command_)).has_value()) {}

auto SubprocessAssertionConverter::name() const -> std::string {
    return command_program(command_);
}

auto SubprocessAssertionConverter::is_available() -> bool {
    return available_;
}

auto SubprocessAssertionConverter::convert(const std::string& text) -> AssertionConversion {
    TemporaryFile temp;
    if (temp.path().empty()) {
        return {.text = text, .success = false, .message = "cannot create temporary file"};
    }

    FileSystem file_system;
    if (!file_system.write_file_atomic(temp.path(), text)) {
        return {.text = text, .success = false, .message = "cannot write temporary file"};
    }

    auto command = run_command(command_ + " " + shell_quote(temp.path()));
    if (!command.started) {
        return {.text = text, .success = false, .message = "cannot start " + name()};
    }
    if (!command.succeeded()) {
        auto message = describe_exit(command);
        auto details = trim_output(command.output);
        if (!details.empty()) {
            message += ": " + details;
        }
        return {.text = text, .success = false, .message = message};
    }

    auto converted = file_system.read_file(temp.path());
    if (!converted) {
        return {.text = text, .success = false, .message = "cannot read converted file"};
    }
    return {.text = std::move(*converted), .success = true, .message = trim_output(command.output)};
}

} // namespace pytestify
