// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

#include "scrawl/ui/raster/surface.hpp"

using namespace scrawl;
using namespace scrawl::ui::raster;

QImage scrawl::ui::raster::make_surface(const int width, const int height) {

    if (width <= 0 || height <= 0)
        throw std::invalid_argument(fmt::format("Invalid image size {}x{}", width, height));

    QImage image(width, height, SurfaceFormat);
    if (image.isNull())
        throw std::runtime_error(fmt::format("Failed to allocate {}x{} image", width, height));

    image.fill(Qt::transparent);
    return image;
}

QColor scrawl::ui::raster::to_qcolor(const utility::ColourTriplet &colour, const float opacity) {
    return QColor::fromRgbF(
        std::clamp(colour.red(), 0.0f, 1.0f),
        std::clamp(colour.green(), 0.0f, 1.0f),
        std::clamp(colour.blue(), 0.0f, 1.0f),
        std::clamp(opacity, 0.0f, 1.0f));
}
