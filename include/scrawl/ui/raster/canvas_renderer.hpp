// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cmath>
#include <optional>
#include <string>

#include <QImage>
#include <QPainter>
#include <QString>

#include "scrawl/ui/canvas/canvas.hpp"
#include "scrawl/ui/raster/surface.hpp"
#include "scrawl/ui/viewport/view_transform.hpp"

namespace scrawl {
namespace ui {
    namespace raster {

        struct RenderSettings {
            // surface units, the head is never shorter than 4x the stroke width
            float arrow_head_length{15.0f};
            // radians either side of the shaft
            float arrow_head_angle{float(M_PI / 6.0)};
            float highlight_opacity{0.3f};
            float highlight_border_width{1.0f};
            // text pixel size is stroke_width * text_size_factor
            float text_size_factor{8.0f};
            std::string font_path;
        };

        /* Class CanvasRenderer
        Paints a Canvas onto a QImage with QPainter: visible layers back to
        front, elements in the order they were added.

        Text needs a font registered with the application font database, so
        a QGuiApplication must exist. If the configured font cannot be loaded
        a warning is logged once and text elements are skipped. */
        class CanvasRenderer {

          public:
            explicit CanvasRenderer(RenderSettings settings = RenderSettings());

            CanvasRenderer(const CanvasRenderer &) = delete;
            CanvasRenderer &operator=(const CanvasRenderer &) = delete;

            [[nodiscard]] const RenderSettings &settings() const { return settings_; }
            void set_settings(const RenderSettings &settings);

            // Paint the canvas, then the working element (if any) on top of
            // everything regardless of its layer's visibility.
            void render(
                QImage &target,
                const canvas::Canvas &canvas,
                const viewport::ViewTransform &transform,
                const canvas::Element *working = nullptr) const;

            void render_element(
                QPainter &painter,
                const canvas::Element &element,
                const viewport::ViewTransform &transform) const;

            [[nodiscard]] bool has_font() const;

          private:
            void render_caption(
                QPainter &painter,
                const canvas::Element &element,
                const viewport::ViewTransform &transform) const;

            const std::optional<QString> &font_family() const;

            RenderSettings settings_;
            mutable std::optional<QString> font_family_;
            mutable bool font_loaded_{false};
        };

    } // namespace raster
} // namespace ui
} // namespace scrawl
