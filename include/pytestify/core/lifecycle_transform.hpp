#pragma once

#include "pytestify/core/python_source.hpp"
#include "pytestify/core/source_edit.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pytestify {

// Rule ids are set only for transforms that are enabled
struct LifecycleOptions {
    std::optional<std::string> base_rule;
    std::optional<std::string> hooks_rule;
    std::optional<std::string> flatten_rule;
    std::vector<std::string> legacy_bases{"unittest.TestCase", "TestCase"};
};

// Test-case base removal, setUp/tearDown to fixtures, class flattening and
// module-level setup/teardown. Each class is one atomic unit.
auto rewrite_lifecycle(const python::SourceModule& module, const LifecycleOptions& options)
    -> PassResult;

} // namespace pytestify
