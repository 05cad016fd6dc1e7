#include "pytestify/ui/ftxui_review_terminal.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#include <unistd.h>

namespace pytestify {

namespace {

// Title, separators, status and hints
constexpr int SCREEN_CHROME_ROWS = 6;

} // namespace

auto FTXUIReviewTerminal::is_interactive() -> bool {
    return isatty(STDIN_FILENO) != 0 && isatty(STDOUT_FILENO) != 0;
}

auto FTXUIReviewTerminal::review(const FileTransformResult& result, size_t index, size_t total)
    -> ReviewDecision {
    auto model = make_review_model(result, index, total);
    auto rows = ftxui::Terminal::Size().dimy - SCREEN_CHROME_ROWS;
    model.page_size = rows > 1 ? static_cast<size_t>(rows) : 1;

    auto final_model = run_reactive_session(model, update);
    return final_model.decision.value_or(ReviewDecision::QUIT);
}

auto FTXUIReviewTerminal::run_reactive_session(
    const ReviewModel& initial_model,
    std::function<ReviewModel(ReviewModel, InputEvent)> update_function) -> ReviewModel {
    using namespace ftxui;

    // Create a mutable copy of the model for the reactive loop
    auto current_model = initial_model;
    auto screen = ScreenInteractive::Fullscreen();

    auto component = CatchEvent(
        Renderer([&] { return screen_to_ftxui_element(compose_review_screen(current_model)); }),
        [&](Event event) -> bool {
            auto input_event = map_ftxui_event_to_input_event(event);
            if (input_event == InputEvent::UNKNOWN) {
                return false;  // Event not handled
            }
            current_model = update_function(current_model, input_event);
            if (current_model.mode == ViewMode::DONE) {
                screen.ExitLoopClosure()();
            }
            return true;
        });

    screen.Loop(component);
    return current_model;
}

auto FTXUIReviewTerminal::map_ftxui_event_to_input_event(const ftxui::Event& event) -> InputEvent {
    if (event == ftxui::Event::ArrowUp) {
        return InputEvent::ARROW_UP;
    }
    if (event == ftxui::Event::ArrowDown) {
        return InputEvent::ARROW_DOWN;
    }
    if (event == ftxui::Event::PageUp) {
        return InputEvent::PAGE_UP;
    }
    if (event == ftxui::Event::PageDown) {
        return InputEvent::PAGE_DOWN;
    }

    // Character input - only map single character commands
    if (event.is_character()) {
        std::string chars = event.character();
        if (chars.length() == 1) {
            switch (chars[0]) {
            case 'y':
            case 'Y':
                return InputEvent::KEEP;
            case 'n':
            case 'N':
                return InputEvent::DISCARD;
            case 'a':
            case 'A':
                return InputEvent::KEEP_ALL;
            case 'q':
            case 'Q':
                return InputEvent::QUIT;
            case 'l':
            case 'L':
                return InputEvent::TOGGLE_LOG;
            default:
                return InputEvent::UNKNOWN;
            }
        }
    }
    return InputEvent::UNKNOWN;
}

auto FTXUIReviewTerminal::screen_to_ftxui_element(const Screen& screen) -> ftxui::Element {
    using namespace ftxui;

    Elements content_elements;
    for (const auto& line : screen.content) {
        switch (line.kind) {
        case DiffLineKind::ADDED:
            content_elements.push_back(text(line.text) | color(Color::Green));
            break;
        case DiffLineKind::REMOVED:
            content_elements.push_back(text(line.text) | color(Color::Red));
            break;
        case DiffLineKind::HUNK:
            content_elements.push_back(text(line.text) | color(Color::Cyan) | dim);
            break;
        case DiffLineKind::CONTEXT:
            content_elements.push_back(text(line.text));
            break;
        }
    }

    return vbox({
        text(screen.title) | bold,
        separator(),
        vbox(std::move(content_elements)) | flex,
        separator(),
        text(screen.status_line) | bold | color(Color::Cyan),
        text(screen.control_hints) | dim,
    });
}

} // namespace pytestify
