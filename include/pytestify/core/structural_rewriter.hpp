#pragma once

#include "pytestify/core/lifecycle_transform.hpp"
#include "pytestify/core/pattern_registry.hpp"
#include "pytestify/core/textual_rewriter.hpp"
#include <optional>
#include <string>

namespace pytestify {

// Rule id per enabled structural transform; a missing id disables the transform
struct StructuralOptions {
    LifecycleOptions lifecycle;
    std::optional<std::string> yield_rule;
    std::optional<std::string> imports_rule;
};

auto structural_options_from(const PatternRegistry& registry) -> StructuralOptions;

// Runs the structural passes in order: lifecycle, yield tests, imports. Each
// pass re-reads the text the previous one produced. A unit either changes
// completely or stays byte-for-byte as it was.
class StructuralRewriter {
public:
    explicit StructuralRewriter(StructuralOptions options);

    auto apply(const std::string& text) const -> RewriteOutcome;

    // Continues from an earlier outcome, appending records and diagnostics
    auto apply(RewriteOutcome& outcome) const -> void;

private:
    StructuralOptions options_;
};

} // namespace pytestify
