#include "pytestify/core/source_edit.hpp"
#include <algorithm>
#include <stdexcept>

namespace pytestify {

auto PassResult::reject(const std::string& rule_id, const std::string& message,
                        std::optional<SourceLocation> location) -> void {
    unresolved.insert(rule_id);
    diagnostics.push_back(Diagnostic{
        .kind = DiagnosticKind::STRUCTURAL_AMBIGUITY,
        .pattern_id = rule_id,
        .message = message,
        .location = location,
    });
}

auto apply_edits(const std::string& text, std::vector<SourceEdit> edits) -> std::string {
    std::stable_sort(edits.begin(), edits.end(), [](const SourceEdit& lhs, const SourceEdit& rhs) {
        if (lhs.begin != rhs.begin) {
            return lhs.begin < rhs.begin;
        }
        return (lhs.end - lhs.begin) < (rhs.end - rhs.begin);  // Insertions first
    });

    std::string result;
    result.reserve(text.size());
    size_t cursor = 0;
    for (const auto& edit : edits) {
        if (edit.begin < cursor || edit.end < edit.begin || edit.end > text.size()) {
            throw std::logic_error("overlapping source edits at offset " +
                                   std::to_string(edit.begin));
        }
        result.append(text, cursor, edit.begin - cursor);
        result.append(edit.replacement);
        cursor = edit.end;
    }
    result.append(text, cursor, std::string::npos);
    return result;
}

} // namespace pytestify
