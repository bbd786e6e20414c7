// SPDX-License-Identifier: Apache-2.0

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "scrawl/ui/canvas/canvas_interaction.hpp"

using namespace scrawl;
using namespace scrawl::ui::canvas;

namespace {

ElementKind kind_for_tool(const Tool tool) {
    switch (tool) {
    case Tool::Rectangle:
        return ElementKind::Rectangle;
    case Tool::Ellipse:
        return ElementKind::Ellipse;
    case Tool::Arrow:
        return ElementKind::Arrow;
    case Tool::Highlight:
        return ElementKind::Highlight;
    case Tool::Text:
        return ElementKind::Text;
    default:
        return ElementKind::Freehand;
    }
}

void check_unlocked(const Canvas &canvas, const utility::Uuid &layer_id) {
    const auto l = canvas.layer(layer_id);
    if (l && l->locked)
        throw RejectedEdit(fmt::format("Layer \"{}\" is locked", l->name));
}

} // anonymous namespace

std::optional<Tool> scrawl::ui::canvas::Tool_from_str(const std::string &name) {
    for (const auto t :
         {Tool::Select,
          Tool::Freehand,
          Tool::Rectangle,
          Tool::Ellipse,
          Tool::Arrow,
          Tool::Text,
          Tool::Highlight,
          Tool::Eraser}) {
        if (Tool_to_str(t) == name)
            return t;
    }
    if (name == "pen")
        return Tool::Freehand;
    if (name == "circle")
        return Tool::Ellipse;
    return {};
}

CanvasInteraction::Outcome
CanvasInteraction::pointer_down(Canvas &canvas, const Imath::V2f &pos) {

    // a second button press while busy is ignored
    if (busy())
        return Outcome::None;

    check_unlocked(canvas, canvas.current_layer_id());

    switch (tool_settings_.tool) {
    case Tool::Select:
    case Tool::Eraser:
        return begin_drag(canvas, pos);

    case Tool::Text:
        text_position_ = pos;
        state_         = State::PendingText;
        return Outcome::TextPending;

    default:
        // clicking elsewhere while text is pending abandons it
        text_position_.reset();
        working_ = Element::Shape(
            kind_for_tool(tool_settings_.tool),
            pos,
            tool_settings_.colour,
            tool_settings_.stroke_width,
            canvas.current_layer_id());
        state_ = State::Capturing;
        return Outcome::Updated;
    }
}

CanvasInteraction::Outcome CanvasInteraction::begin_drag(Canvas &canvas, const Imath::V2f &pos) {

    const auto hit = hit_test(pos, canvas, hit_settings_);
    if (!hit) {
        const bool had_selection = bool(selection_);
        selection_.reset();
        return had_selection ? Outcome::Deselected : Outcome::None;
    }

    check_unlocked(canvas, hit->layer_id());

    selection_      = hit->id();
    drag_original_  = *hit;
    drag_offset_    = pos - hit->anchor();
    state_          = State::Dragging;
    return Outcome::Selected;
}

CanvasInteraction::Outcome
CanvasInteraction::pointer_move(Canvas &canvas, const Imath::V2f &pos) {

    switch (state_) {
    case State::Capturing:
        working_->add_point(pos);
        return Outcome::Updated;

    case State::Dragging: {
        const auto current = canvas.element(*selection_);
        if (!current) {
            reset();
            return Outcome::Discarded;
        }
        Element moved = *current;
        moved.translate((pos - drag_offset_) - moved.anchor());
        canvas.replace_element(moved);
        return Outcome::Updated;
    }

    default:
        return Outcome::None;
    }
}

CanvasInteraction::Outcome
CanvasInteraction::pointer_up(Canvas &canvas, const Imath::V2f &) {

    switch (state_) {
    case State::Capturing: {
        // the release position was already delivered as a move
        Element e = *working_;
        working_.reset();
        state_ = State::Idle;

        if (is_two_point_kind(e.kind()) && e.is_degenerate()) {
            spdlog::debug(
                "{} discarding zero size {}", __PRETTY_FUNCTION__, ElementKind_to_str(e.kind()));
            return Outcome::Discarded;
        }

        canvas.append_element(e);
        return Outcome::Committed;
    }

    case State::Dragging: {
        state_              = State::Idle;
        const auto original = std::move(drag_original_);
        drag_original_.reset();

        const auto current = selection_ ? canvas.element(*selection_) : nullptr;
        if (!current)
            return Outcome::Discarded;
        return (original && *original == *current) ? Outcome::Selected : Outcome::Committed;
    }

    default:
        return Outcome::None;
    }
}

CanvasInteraction::Outcome CanvasInteraction::cancel(Canvas &canvas) {

    switch (state_) {
    case State::Capturing:
        working_.reset();
        state_ = State::Idle;
        return Outcome::Discarded;

    case State::Dragging:
        if (drag_original_ && canvas.element(drag_original_->id())) {
            try {
                canvas.replace_element(*drag_original_);
            } catch (const RejectedEdit &e) {
                spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
            }
        }
        drag_original_.reset();
        state_ = State::Idle;
        return Outcome::Discarded;

    default:
        return Outcome::None;
    }
}

CanvasInteraction::Outcome
CanvasInteraction::confirm_text(Canvas &canvas, const std::string &text) {

    if (state_ != State::PendingText || !text_position_ || text.empty())
        return Outcome::None;

    canvas.append_element(Element::Caption(
        *text_position_,
        text,
        tool_settings_.colour,
        tool_settings_.text_stroke_width,
        canvas.current_layer_id()));

    text_position_.reset();
    state_ = State::Idle;
    return Outcome::Committed;
}

CanvasInteraction::Outcome CanvasInteraction::cancel_text() {

    if (state_ != State::PendingText)
        return Outcome::None;

    text_position_.reset();
    state_ = State::Idle;
    return Outcome::Discarded;
}

void CanvasInteraction::reset() {
    state_ = State::Idle;
    working_.reset();
    selection_.reset();
    text_position_.reset();
    drag_original_.reset();
}
