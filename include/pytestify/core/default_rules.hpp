#pragma once

#include "pytestify/core/pattern_registry.hpp"
#include <string_view>

namespace pytestify {

// Structural transform tags understood by the structural rewriter
inline constexpr std::string_view TAG_LIFECYCLE_BASE = "lifecycle_base";
inline constexpr std::string_view TAG_LIFECYCLE_HOOKS = "lifecycle_hooks";
inline constexpr std::string_view TAG_FLATTEN_CLASS = "flatten_class";
inline constexpr std::string_view TAG_YIELD_TESTS = "yield_tests";
inline constexpr std::string_view TAG_PYTEST_IMPORTS = "pytest_imports";

// Registers the built-in nose/unittest catalogue
auto register_default_rules(PatternRegistry& registry) -> void;

auto make_default_registry() -> PatternRegistry;

} // namespace pytestify
