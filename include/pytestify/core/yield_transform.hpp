#pragma once

#include "pytestify/core/python_source.hpp"
#include "pytestify/core/source_edit.hpp"
#include <string>
#include <string_view>

namespace pytestify {

constexpr std::string_view FOLLOW_UP_MARKER = "# pytestify: manual follow-up required";

// Comment line placed above a unit that needs manual work
auto follow_up_marker(std::string_view indent, std::string_view rule_id, std::string_view reason)
    -> std::string;

// Generator tests ("yield check, 1, 2") to @pytest.mark.parametrize. Each test
// function is one atomic unit; unsupported shapes get a follow-up marker.
auto rewrite_yield_tests(const python::SourceModule& module, const std::string& rule_id)
    -> PassResult;

} // namespace pytestify
