// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>

#include <Imath/ImathVec.h>

namespace scrawl {
namespace ui {
    namespace viewport {

        /* Class ViewTransform
        Maps device pixels (relative to the host window) to drawing surface
        coordinates and back:

            surface = (device - origin - pan) / zoom
            device  = surface * zoom + origin + pan

        Zoom is changed by two finger pinch and is clamped to
        [min_zoom, max_zoom]. Pan only applies while zoomed in, and is reset
        whenever zoom drops back to the minimum. */
        class ViewTransform {

          public:
            ViewTransform(const float min_zoom = 1.0f, const float max_zoom = 5.0f);

            [[nodiscard]] Imath::V2f to_surface(const Imath::V2f &device) const;
            [[nodiscard]] Imath::V2f to_device(const Imath::V2f &surface) const;

            [[nodiscard]] float zoom() const { return zoom_; }
            [[nodiscard]] const Imath::V2f &pan() const { return pan_; }
            [[nodiscard]] const Imath::V2f &origin() const { return origin_; }
            [[nodiscard]] float min_zoom() const { return min_zoom_; }
            [[nodiscard]] float max_zoom() const { return max_zoom_; }

            void set_origin(const Imath::V2f &origin) { origin_ = origin; }
            void set_zoom_range(const float min_zoom, const float max_zoom);

            // Direct setters, zoom is clamped to the allowed range
            void set_zoom(const float zoom);
            void set_pan(const Imath::V2f &pan);

            [[nodiscard]] bool is_zoomed() const { return zoom_ > min_zoom_; }

            // Pinch gesture. Contacts are in device pixels.
            void begin_pinch(const Imath::V2f &contact1, const Imath::V2f &contact2);
            void update_pinch(const Imath::V2f &contact1, const Imath::V2f &contact2);
            void end_pinch();
            [[nodiscard]] bool pinching() const { return bool(pinch_); }

            // Single contact pan. Has no effect unless zoomed in.
            void begin_pan(const Imath::V2f &device);
            void update_pan(const Imath::V2f &device);
            void end_pan();
            [[nodiscard]] bool panning() const { return bool(pan_anchor_); }

            void reset();

          private:
            struct Pinch {
                Imath::V2f midpoint;
                float distance;
            };

            float min_zoom_;
            float max_zoom_;
            float zoom_{1.0f};
            Imath::V2f pan_{0.0f, 0.0f};
            Imath::V2f origin_{0.0f, 0.0f};

            std::optional<Pinch> pinch_;
            std::optional<Imath::V2f> pan_anchor_;
        };

    } // namespace viewport
} // namespace ui
} // namespace scrawl
