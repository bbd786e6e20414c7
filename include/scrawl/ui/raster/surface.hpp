// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <QColor>
#include <QImage>
#include <QPointF>

#include <Imath/ImathVec.h>

#include "scrawl/utility/colour.hpp"

namespace scrawl {
namespace ui {
    namespace raster {

        // Images are always premultiplied ARGB, the format QPainter is fastest on.
        inline constexpr QImage::Format SurfaceFormat = QImage::Format_ARGB32_Premultiplied;

        // A fully transparent image. Throws std::invalid_argument on a
        // non-positive size.
        QImage make_surface(const int width, const int height);

        QColor to_qcolor(const utility::ColourTriplet &colour, const float opacity = 1.0f);

        inline QPointF to_qpoint(const Imath::V2f &p) { return QPointF(p.x, p.y); }

    } // namespace raster
} // namespace ui
} // namespace scrawl
