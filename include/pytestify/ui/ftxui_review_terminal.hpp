#pragma once

#include "pytestify/interfaces.hpp"
#include "pytestify/ui/review_model.hpp"

#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>

#include <functional>

namespace pytestify {

// Full-screen keep/discard review of one changed file at a time
class FTXUIReviewTerminal : public IReviewTerminal {
public:
    FTXUIReviewTerminal() = default;

    // Delete copy operations to ensure single instance
    FTXUIReviewTerminal(const FTXUIReviewTerminal&) = delete;
    auto operator=(const FTXUIReviewTerminal&) -> FTXUIReviewTerminal& = delete;

    auto is_interactive() -> bool override;
    auto review(const FileTransformResult& result, size_t index, size_t total)
        -> ReviewDecision override;

    // Runs the event loop until the model reaches ViewMode::DONE
    auto run_reactive_session(const ReviewModel& initial_model,
                              std::function<ReviewModel(ReviewModel, InputEvent)> update_function)
        -> ReviewModel;

private:
    auto map_ftxui_event_to_input_event(const ftxui::Event& event) -> InputEvent;
    auto screen_to_ftxui_element(const Screen& screen) -> ftxui::Element;
};

} // namespace pytestify
