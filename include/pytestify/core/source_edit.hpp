#pragma once

#include "pytestify/types.hpp"
#include <set>
#include <string>
#include <vector>

namespace pytestify {

// Replace [begin, end) of the pass input with replacement; begin == end inserts
struct SourceEdit {
    size_t begin{};
    size_t end{};
    std::string replacement;
};

// Edits for one structural unit; either all of them apply or none
struct UnitRewrite {
    std::vector<SourceEdit> edits;
    ChangeLog records;
};

struct PassResult {
    std::vector<UnitRewrite> units;
    std::set<std::string> unresolved;
    std::vector<Diagnostic> diagnostics;

    auto reject(const std::string& rule_id, const std::string& message,
                std::optional<SourceLocation> location) -> void;
};

// Throws std::logic_error when two edits overlap
auto apply_edits(const std::string& text, std::vector<SourceEdit> edits) -> std::string;

} // namespace pytestify
