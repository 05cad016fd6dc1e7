#pragma once

#include "pytestify/core/pattern_registry.hpp"
#include "pytestify/core/structural_rewriter.hpp"
#include "pytestify/core/textual_rewriter.hpp"
#include "pytestify/interfaces.hpp"
#include "pytestify/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace pytestify {

// Id used for records and diagnostics of the external converter pass
inline constexpr std::string_view ASSERTION_CONVERTER_ID = "assertion_converter";

// true while nose.tools or TestCase assertion calls are still present
auto has_legacy_assertions(std::string_view text) -> bool;

// Whole-file pipeline: textual rules, structural passes, then the external
// assertion converter when legacy assertions remain. Holds no per-file state,
// so one engine can serve several worker threads as long as the converter is
// thread-safe.
class MigrationEngine {
public:
    // Finalizes the registry. The converter is not owned and may be null.
    explicit MigrationEngine(PatternRegistry registry, IAssertionConverter* converter = nullptr);

    auto transform_text(const std::string& path, const std::string& text) const
        -> FileTransformResult;

    auto registry() const -> const PatternRegistry&
    {
        return registry_;
    }

private:
    auto rewrite(RewriteOutcome& outcome) const -> void;
    auto run_assertion_converter(RewriteOutcome& outcome, FileTransformResult& result) const
        -> void;

    PatternRegistry registry_;
    std::vector<TransformationRule> textual_rules_;
    StructuralRewriter structural_;
    IAssertionConverter* converter_;
};

} // namespace pytestify
