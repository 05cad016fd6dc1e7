#include "pytestify/ui/review_model.hpp"
#include <algorithm>
#include <sstream>

namespace pytestify {

namespace {

// Above this many cells the diff falls back to one removed/added block
constexpr size_t MAX_DIFF_CELLS = 4'000'000;

auto split_lines(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        lines.push_back(line);
    }
    return lines;
}

auto diff_middle(const std::vector<std::string>& before, const std::vector<std::string>& after,
                 size_t begin, size_t before_end, size_t after_end) -> std::vector<DiffLine> {
    std::vector<DiffLine> ops;
    auto rows = before_end - begin;
    auto cols = after_end - begin;

    if (rows * cols > MAX_DIFF_CELLS) {
        for (auto i = begin; i < before_end; ++i) {
            ops.push_back({DiffLineKind::REMOVED, before[i]});
        }
        for (auto j = begin; j < after_end; ++j) {
            ops.push_back({DiffLineKind::ADDED, after[j]});
        }
        return ops;
    }

    // lcs[i][j]: longest common subsequence of the suffixes starting at i and j
    std::vector<size_t> lcs((rows + 1) * (cols + 1), 0);
    auto at = [cols](size_t i, size_t j) { return i * (cols + 1) + j; };
    for (size_t i = rows; i-- > 0;) {
        for (size_t j = cols; j-- > 0;) {
            lcs[at(i, j)] = before[begin + i] == after[begin + j]
                                ? lcs[at(i + 1, j + 1)] + 1
                                : std::max(lcs[at(i + 1, j)], lcs[at(i, j + 1)]);
        }
    }

    size_t i = 0;
    size_t j = 0;
    while (i < rows || j < cols) {
        if (i < rows && j < cols && before[begin + i] == after[begin + j]) {
            ops.push_back({DiffLineKind::CONTEXT, before[begin + i]});
            ++i;
            ++j;
        } else if (j < cols && (i == rows || lcs[at(i, j + 1)] > lcs[at(i + 1, j)])) {
            ops.push_back({DiffLineKind::ADDED, after[begin + j]});
            ++j;
        } else {
            ops.push_back({DiffLineKind::REMOVED, before[begin + i]});
            ++i;
        }
    }
    return ops;
}

auto first_line_of(const std::string& text, size_t limit) -> std::string {
    auto line = text.substr(0, text.find('\n'));
    if (line.size() > limit) {
        line = line.substr(0, limit) + "...";
    } else if (line.size() < text.size()) {
        line += " ...";
    }
    return line;
}

} // namespace

auto compute_line_diff(const std::string& before, const std::string& after, size_t context)
    -> std::vector<DiffLine> {
    auto old_lines = split_lines(before);
    auto new_lines = split_lines(after);

    size_t prefix = 0;
    while (prefix < old_lines.size() && prefix < new_lines.size() &&
           old_lines[prefix] == new_lines[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < old_lines.size() - prefix && suffix < new_lines.size() - prefix &&
           old_lines[old_lines.size() - 1 - suffix] == new_lines[new_lines.size() - 1 - suffix]) {
        ++suffix;
    }

    std::vector<DiffLine> ops;
    for (size_t i = 0; i < prefix; ++i) {
        ops.push_back({DiffLineKind::CONTEXT, old_lines[i]});
    }
    auto middle = diff_middle(old_lines, new_lines, prefix, old_lines.size() - suffix,
                              new_lines.size() - suffix);
    ops.insert(ops.end(), middle.begin(), middle.end());
    for (auto i = old_lines.size() - suffix; i < old_lines.size(); ++i) {
        ops.push_back({DiffLineKind::CONTEXT, old_lines[i]});
    }

    // Keep changed lines plus `context` lines on either side
    std::vector<bool> include(ops.size(), false);
    for (size_t i = 0; i < ops.size(); ++i) {
        if (ops[i].kind == DiffLineKind::CONTEXT) {
            continue;
        }
        auto from = i >= context ? i - context : 0;
        auto to = std::min(ops.size(), i + context + 1);
        std::fill(include.begin() + static_cast<std::ptrdiff_t>(from),
                  include.begin() + static_cast<std::ptrdiff_t>(to), true);
    }

    std::vector<DiffLine> diff;
    size_t old_line = 1;
    size_t new_line = 1;
    for (size_t i = 0; i < ops.size(); ++i) {
        if (include[i]) {
            if (i == 0 || !include[i - 1]) {
                diff.push_back({DiffLineKind::HUNK, "@@ -" + std::to_string(old_line) + " +" +
                                                        std::to_string(new_line) + " @@"});
            }
            char marker = ops[i].kind == DiffLineKind::REMOVED ? '-'
                          : ops[i].kind == DiffLineKind::ADDED ? '+'
                                                               : ' ';
            diff.push_back({ops[i].kind, marker + ops[i].text});
        }
        if (ops[i].kind != DiffLineKind::ADDED) {
            ++old_line;
        }
        if (ops[i].kind != DiffLineKind::REMOVED) {
            ++new_line;
        }
    }
    return diff;
}

auto make_review_model(const FileTransformResult& result, size_t index, size_t total)
    -> ReviewModel {
    ReviewModel model{
        .path = result.path,
        .file_index = index,
        .file_total = total,
        .diff = compute_line_diff(result.original_text, result.new_text),
    };

    for (const auto& record : result.change_log) {
        model.log_lines.push_back("line " + std::to_string(record.location.line) + ": " +
                                  record.rule_id + ": " +
                                  first_line_of(record.original_fragment, 60) + " -> " +
                                  first_line_of(record.replacement_fragment, 60));
    }
    for (const auto& diagnostic : result.diagnostics) {
        auto where = diagnostic.location ? "line " + std::to_string(diagnostic.location->line) + ": "
                                         : std::string{};
        model.log_lines.push_back("[" + diagnostic_kind_name(diagnostic.kind) + "] " + where +
                                  diagnostic.pattern_id + ": " + diagnostic.message);
    }
    if (result.assertion_pass != AssertionPassStatus::NOT_NEEDED) {
        model.log_lines.push_back("assertion converter: " +
                                  assertion_status_name(result.assertion_pass));
    }
    return model;
}

auto update(ReviewModel model, InputEvent event) -> ReviewModel {
    if (model.mode == ViewMode::DONE) {
        return model;
    }
    if (event != InputEvent::QUIT && event != InputEvent::UNKNOWN) {
        model.quit_confirmation_needed = false;
        model.status_message.clear();
    }

    switch (event) {
    case InputEvent::ARROW_UP:
        if (model.scroll_offset > 0) {
            model.scroll_offset--;
        }
        break;

    case InputEvent::ARROW_DOWN:
        if (model.scroll_offset < model.max_scroll()) {
            model.scroll_offset++;
        }
        break;

    case InputEvent::PAGE_UP:
        model.scroll_offset -= std::min(model.scroll_offset, model.page_size);
        break;

    case InputEvent::PAGE_DOWN:
        model.scroll_offset = std::min(model.max_scroll(), model.scroll_offset + model.page_size);
        break;

    case InputEvent::TOGGLE_LOG:
        model.mode = model.mode == ViewMode::DIFF ? ViewMode::CHANGE_LOG : ViewMode::DIFF;
        model.scroll_offset = 0;
        break;

    case InputEvent::KEEP:
        model.decision = ReviewDecision::KEEP;
        model.mode = ViewMode::DONE;
        break;

    case InputEvent::DISCARD:
        model.decision = ReviewDecision::DISCARD;
        model.mode = ViewMode::DONE;
        break;

    case InputEvent::KEEP_ALL:
        model.decision = ReviewDecision::KEEP_ALL;
        model.mode = ViewMode::DONE;
        break;

    case InputEvent::QUIT:
        if (model.quit_confirmation_needed) {
            model.decision = ReviewDecision::QUIT;
            model.mode = ViewMode::DONE;
        } else {
            model.quit_confirmation_needed = true;
            model.status_message = "Press q again to quit; this and remaining files stay unchanged";
        }
        break;

    case InputEvent::UNKNOWN:
        break;
    }
    return model;
}

auto compose_review_screen(const ReviewModel& model) -> Screen {
    Screen screen;
    screen.title = "File " + std::to_string(model.file_index + 1) + "/" +
                   std::to_string(model.file_total) + ": " + model.path;

    auto count = model.visible_line_count();
    auto end = std::min(count, model.scroll_offset + model.page_size);
    for (auto i = model.scroll_offset; i < end; ++i) {
        if (model.mode == ViewMode::CHANGE_LOG) {
            screen.content.push_back(Line{.text = model.log_lines[i]});
        } else {
            screen.content.push_back(Line{.text = model.diff[i].text, .kind = model.diff[i].kind});
        }
    }

    if (model.quit_confirmation_needed) {
        screen.status_line = model.status_message;
    } else {
        auto view = model.mode == ViewMode::CHANGE_LOG ? "Change log" : "Diff";
        screen.status_line = std::string(view) + " | lines " +
                             std::to_string(count == 0 ? 0 : model.scroll_offset + 1) + "-" +
                             std::to_string(end) + " of " + std::to_string(count);
    }

    screen.control_hints = std::string("Keep [y] Discard [n] Keep all [a] Quit [q] Scroll [↑↓ PgUp PgDn] ") +
                           (model.mode == ViewMode::CHANGE_LOG ? "Diff [l]" : "Log [l]");
    return screen;
}

} // namespace pytestify
