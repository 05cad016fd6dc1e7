#pragma once

#include "pytestify/core/python_source.hpp"
#include "pytestify/core/source_edit.hpp"
#include <string>

namespace pytestify {

// Adds "import pytest" when pytest is referenced but not imported, drops a
// repeated "import pytest" and unittest imports nothing refers to anymore
auto rewrite_pytest_imports(const python::SourceModule& module, const std::string& rule_id)
    -> PassResult;

} // namespace pytestify
