// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <Imath/ImathVec.h>

#include "scrawl/ui/canvas/canvas.hpp"
#include "scrawl/ui/canvas/hit_test.hpp"


namespace scrawl {
namespace ui {
    namespace canvas {

        enum class Tool { Select, Freehand, Rectangle, Ellipse, Arrow, Text, Highlight, Eraser };

        constexpr std::string_view Tool_to_str(const Tool tool) {
            switch (tool) {
            case Tool::Select:
                return "select";
            case Tool::Freehand:
                return "freehand";
            case Tool::Rectangle:
                return "rectangle";
            case Tool::Ellipse:
                return "ellipse";
            case Tool::Arrow:
                return "arrow";
            case Tool::Text:
                return "text";
            case Tool::Highlight:
                return "highlight";
            case Tool::Eraser:
                return "eraser";
            }
            return "undefined";
        }

        std::optional<Tool> Tool_from_str(const std::string &name);

        struct ToolSettings {
            Tool tool{Tool::Freehand};
            utility::ColourTriplet colour{1.0f, 0.0f, 0.0f};
            float stroke_width{3.0f};
            float text_stroke_width{2.0f};
        };

        /* Class CanvasInteraction
        Turns pointer input (already in surface coordinates) into edits of a
        Canvas.

            Idle -> Capturing -> Idle      drawing tools
            Idle -> Dragging -> Idle       select / eraser over an element
            Idle -> PendingText -> Idle    text tool

        Committed edits are applied to the canvas straight away; the caller
        takes a history snapshot whenever a call returns Outcome::Committed.
        Calls that are refused because of a locked layer throw RejectedEdit
        and leave both the canvas and the interaction state untouched. */
        class CanvasInteraction {

          public:
            enum class State { Idle, Capturing, Dragging, PendingText };

            enum class Outcome {
                None,        // nothing to do
                Updated,     // working element or drag position changed
                Committed,   // canvas changed, take a snapshot
                Discarded,   // capture thrown away
                Selected,    // selection changed without an edit
                Deselected,  // click on empty space
                TextPending  // waiting for text
            };

            CanvasInteraction(HitTestSettings hit_settings = HitTestSettings())
                : hit_settings_(hit_settings) {}

            Outcome pointer_down(Canvas &canvas, const Imath::V2f &pos);
            Outcome pointer_move(Canvas &canvas, const Imath::V2f &pos);
            Outcome pointer_up(Canvas &canvas, const Imath::V2f &pos);

            // Drop any capture without committing it, put a dragged element
            // back where it started. Pending text is left alone.
            Outcome cancel(Canvas &canvas);

            Outcome confirm_text(Canvas &canvas, const std::string &text);
            Outcome cancel_text();

            // back to Idle with nothing selected, canvas is not touched
            void reset();

            [[nodiscard]] State state() const { return state_; }
            [[nodiscard]] bool busy() const {
                return state_ == State::Capturing || state_ == State::Dragging;
            }

            // The uncommitted element while capturing
            [[nodiscard]] const std::optional<Element> &working_element() const {
                return working_;
            }
            [[nodiscard]] const std::optional<utility::Uuid> &selection() const {
                return selection_;
            }
            [[nodiscard]] const std::optional<Imath::V2f> &pending_text_position() const {
                return text_position_;
            }

            [[nodiscard]] const ToolSettings &tool_settings() const { return tool_settings_; }
            void set_tool_settings(const ToolSettings &settings) { tool_settings_ = settings; }

            [[nodiscard]] const HitTestSettings &hit_settings() const { return hit_settings_; }
            void set_hit_settings(const HitTestSettings &settings) { hit_settings_ = settings; }

            void clear_selection() { selection_.reset(); }

          private:
            Outcome begin_drag(Canvas &canvas, const Imath::V2f &pos);

            HitTestSettings hit_settings_;
            ToolSettings tool_settings_;

            State state_{State::Idle};
            std::optional<Element> working_;
            std::optional<utility::Uuid> selection_;
            std::optional<Imath::V2f> text_position_;

            // drag
            std::optional<Element> drag_original_;
            Imath::V2f drag_offset_{0.0f, 0.0f};
        };

    } // end namespace canvas
} // end namespace ui
} // end namespace scrawl
