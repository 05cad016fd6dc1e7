#pragma once

#include "pytestify/interfaces.hpp"
#include "pytestify/io/command.hpp"
#include <string>

namespace pytestify {

inline constexpr const char* DEFAULT_ASSERTION_CONVERTER = "nose2pytest";

// Runs an external command that rewrites a Python file in place, e.g.
// "nose2pytest". The text goes through a private temporary file; exit status
// 0 means success and the rewritten file is read back.
class SubprocessAssertionConverter : public IAssertionConverter {
public:
    explicit SubprocessAssertionConverter(std::string command = DEFAULT_ASSERTION_CONVERTER);

    auto name() const -> std::string override;
    auto is_available() -> bool override;
    auto convert(const std::string& text) -> AssertionConversion override;

private:
    std::string command_;
    bool available_ = false;
};

} // namespace pytestify
