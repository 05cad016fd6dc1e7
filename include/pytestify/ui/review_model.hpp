#pragma once

#include "pytestify/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pytestify {

// Input events from terminal
enum class InputEvent {
    ARROW_UP,
    ARROW_DOWN,
    PAGE_UP,
    PAGE_DOWN,
    KEEP,
    DISCARD,
    KEEP_ALL,
    QUIT,
    TOGGLE_LOG,
    UNKNOWN
};

// View modes for the review screen
enum class ViewMode {
    DIFF,
    CHANGE_LOG,
    DONE
};

enum class DiffLineKind {
    CONTEXT,
    REMOVED,
    ADDED,
    HUNK
};

struct DiffLine {
    DiffLineKind kind = DiffLineKind::CONTEXT;
    std::string text;

    auto operator==(const DiffLine& other) const -> bool = default;
};

// Immutable review state for one changed file
struct ReviewModel {
    std::string path;
    size_t file_index{};   // 0-based
    size_t file_total{};
    std::vector<DiffLine> diff;
    std::vector<std::string> log_lines;   // Change log and diagnostics

    ViewMode mode = ViewMode::DIFF;
    size_t scroll_offset{};
    size_t page_size = 20;

    std::optional<ReviewDecision> decision;
    std::string status_message;
    bool quit_confirmation_needed = false;   // Prevent accidental quit

    auto visible_line_count() const -> size_t
    {
        return mode == ViewMode::CHANGE_LOG ? log_lines.size() : diff.size();
    }

    auto max_scroll() const -> size_t
    {
        auto count = visible_line_count();
        return count > page_size ? count - page_size : 0;
    }
};

// Screen structure for declarative rendering
struct Line {
    std::string text;
    DiffLineKind kind = DiffLineKind::CONTEXT;
};

struct Screen {
    std::string title;
    std::vector<Line> content;
    std::string status_line;
    std::string control_hints;
};

// Unified-style line diff with the given amount of context around each hunk
auto compute_line_diff(const std::string& before, const std::string& after, size_t context = 3)
    -> std::vector<DiffLine>;

auto make_review_model(const FileTransformResult& result, size_t index, size_t total)
    -> ReviewModel;

// Pure state transition function
auto update(ReviewModel model, InputEvent event) -> ReviewModel;

auto compose_review_screen(const ReviewModel& model) -> Screen;

} // namespace pytestify
