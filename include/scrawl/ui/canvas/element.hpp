// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Imath/ImathBox.h>
#include <Imath/ImathVec.h>
#include <nlohmann/json.hpp>

#include "scrawl/utility/colour.hpp"
#include "scrawl/utility/uuid.hpp"


namespace scrawl {
namespace ui {
    namespace canvas {

        enum class ElementKind { Freehand, Rectangle, Ellipse, Arrow, Text, Highlight };

        constexpr std::string_view ElementKind_to_str(const ElementKind kind) {
            switch (kind) {
            case ElementKind::Freehand:
                return "freehand";
            case ElementKind::Rectangle:
                return "rectangle";
            case ElementKind::Ellipse:
                return "ellipse";
            case ElementKind::Arrow:
                return "arrow";
            case ElementKind::Text:
                return "text";
            case ElementKind::Highlight:
                return "highlight";
            }
            return "undefined";
        }

        // Also accepts the "pen" and "circle" aliases. Empty for anything else.
        std::optional<ElementKind> ElementKind_from_str(const std::string &name);

        // Kinds that are drawn by dragging between two corners or two ends
        inline bool is_two_point_kind(const ElementKind kind) {
            return kind == ElementKind::Rectangle || kind == ElementKind::Ellipse ||
                   kind == ElementKind::Arrow || kind == ElementKind::Highlight;
        }

        /* Class Element
        A single annotation primitive. Freehand elements keep every sampled
        point, text elements keep their origin (baseline left), and all other
        kinds keep exactly the anchor point and the current end point. */
        class Element {

          public:
            Element() : id_(utility::Uuid::generate()) {}
            Element(const Element &o) = default;
            Element &operator=(const Element &o) = default;

            static Element Shape(
                const ElementKind kind,
                const Imath::V2f &anchor,
                const utility::ColourTriplet &colour,
                const float stroke_width,
                const utility::Uuid &layer_id);

            static Element Caption(
                const Imath::V2f &origin,
                const std::string &text,
                const utility::ColourTriplet &colour,
                const float stroke_width,
                const utility::Uuid &layer_id);

            bool operator==(const Element &o) const;
            bool operator!=(const Element &o) const { return !(*this == o); }

            // Freehand: append the sample unless it repeats the last one.
            // Two point kinds: same as set_end_point.
            void add_point(const Imath::V2f &pt);

            // Replace points with [anchor, pt]
            void set_end_point(const Imath::V2f &pt);

            void translate(const Imath::V2f &delta);

            // Fewer than 2 distinct points
            [[nodiscard]] bool is_degenerate() const;

            [[nodiscard]] Imath::Box2f bounding_box() const;

            [[nodiscard]] const utility::Uuid &id() const { return id_; }
            [[nodiscard]] ElementKind kind() const { return kind_; }
            [[nodiscard]] const std::vector<Imath::V2f> &points() const { return points_; }
            [[nodiscard]] const Imath::V2f &anchor() const { return points_.front(); }
            [[nodiscard]] const utility::ColourTriplet &colour() const { return colour_; }
            [[nodiscard]] float stroke_width() const { return stroke_width_; }
            [[nodiscard]] const std::optional<std::string> &text() const { return text_; }
            [[nodiscard]] const utility::Uuid &layer_id() const { return layer_id_; }

            void set_layer_id(const utility::Uuid &layer_id) { layer_id_ = layer_id; }

            friend void from_json(const nlohmann::json &j, Element &e);
            friend void to_json(nlohmann::json &j, const Element &e);

          private:
            utility::Uuid id_;
            ElementKind kind_{ElementKind::Freehand};
            std::vector<Imath::V2f> points_;
            utility::ColourTriplet colour_{1.0f, 0.0f, 0.0f};
            float stroke_width_{3.0f};
            std::optional<std::string> text_;
            utility::Uuid layer_id_;
        };

        using ElementVec = std::vector<Element>;

        void from_json(const nlohmann::json &j, Element &e);
        void to_json(nlohmann::json &j, const Element &e);

    } // end namespace canvas
} // end namespace ui
} // end namespace scrawl
