// SPDX-License-Identifier: Apache-2.0

#include <algorithm>

#include <QFont>
#include <QFontDatabase>
#include <QGuiApplication>
#include <QPen>
#include <QPolygonF>
#include <QRectF>

#include <spdlog/spdlog.h>

#include "scrawl/ui/helpers.hpp"
#include "scrawl/ui/raster/canvas_renderer.hpp"

using namespace scrawl;
using namespace scrawl::ui;
using namespace scrawl::ui::canvas;
using namespace scrawl::ui::raster;

namespace {

QPen stroke_pen(const QColor &colour, const float width) {
    return QPen(colour, qreal(width), Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
}

QRectF corner_rect(const Imath::V2f &a, const Imath::V2f &b) {
    return QRectF(to_qpoint(a), to_qpoint(b)).normalized();
}

} // anonymous namespace

CanvasRenderer::CanvasRenderer(RenderSettings settings) : settings_(std::move(settings)) {}

void CanvasRenderer::set_settings(const RenderSettings &settings) {
    if (settings.font_path != settings_.font_path) {
        font_family_.reset();
        font_loaded_ = false;
    }
    settings_ = settings;
}

bool CanvasRenderer::has_font() const { return font_family().has_value(); }

const std::optional<QString> &CanvasRenderer::font_family() const {

    if (font_loaded_)
        return font_family_;
    font_loaded_ = true;

    if (!qGuiApp) {
        spdlog::warn(
            "{} no QGuiApplication, text will not be drawn", __PRETTY_FUNCTION__);
        return font_family_;
    }

    const int id =
        QFontDatabase::addApplicationFont(QString::fromStdString(settings_.font_path));
    const auto families = id < 0 ? QStringList() : QFontDatabase::applicationFontFamilies(id);

    if (families.isEmpty()) {
        spdlog::warn(
            "{} Failed to load font \"{}\", text will not be drawn",
            __PRETTY_FUNCTION__,
            settings_.font_path);
    } else {
        font_family_ = families.front();
        spdlog::debug(
            "{} loaded {} ({})",
            __PRETTY_FUNCTION__,
            settings_.font_path,
            font_family_->toStdString());
    }
    return font_family_;
}

void CanvasRenderer::render(
    QImage &target,
    const Canvas &canvas,
    const viewport::ViewTransform &transform,
    const Element *working) const {

    if (target.isNull())
        return;

    QPainter painter(&target);
    painter.setRenderHint(QPainter::Antialiasing);

    for (const auto element : canvas.paint_order())
        render_element(painter, *element, transform);

    if (working)
        render_element(painter, *working, transform);
}

void CanvasRenderer::render_element(
    QPainter &painter, const Element &element, const viewport::ViewTransform &transform) const {

    if (element.points().empty())
        return;

    if (element.kind() == ElementKind::Text) {
        render_caption(painter, element, transform);
        return;
    }

    const float zoom   = transform.zoom();
    const auto &pts    = element.points();
    const auto a       = transform.to_device(pts.front());
    const auto b       = transform.to_device(pts.back());
    const QColor color = to_qcolor(element.colour());

    painter.save();
    painter.setBrush(Qt::NoBrush);
    painter.setPen(stroke_pen(color, element.stroke_width() * zoom));

    switch (element.kind()) {
    case ElementKind::Freehand: {
        if (pts.size() == 1) {
            painter.drawPoint(to_qpoint(a));
        } else {
            QPolygonF line;
            line.reserve(int(pts.size()));
            for (const auto &p : pts)
                line << to_qpoint(transform.to_device(p));
            painter.drawPolyline(line);
        }
        break;
    }

    case ElementKind::Rectangle:
        painter.drawRect(corner_rect(a, b));
        break;

    case ElementKind::Ellipse:
        painter.drawEllipse(corner_rect(a, b));
        break;

    case ElementKind::Arrow: {
        const float head =
            std::max(settings_.arrow_head_length, element.stroke_width() * 4.0f) * zoom;
        const auto wings = utility::arrow_head(a, b, head, settings_.arrow_head_angle);
        painter.drawLine(to_qpoint(a), to_qpoint(b));
        painter.drawLine(to_qpoint(b), to_qpoint(wings[0]));
        painter.drawLine(to_qpoint(b), to_qpoint(wings[1]));
        break;
    }

    case ElementKind::Highlight: {
        const auto rect = corner_rect(a, b);
        painter.fillRect(rect, to_qcolor(element.colour(), settings_.highlight_opacity));
        painter.setPen(QPen(color, qreal(settings_.highlight_border_width * zoom)));
        painter.drawRect(rect);
        break;
    }

    default:
        break;
    }

    painter.restore();
}

void CanvasRenderer::render_caption(
    QPainter &painter, const Element &element, const viewport::ViewTransform &transform) const {

    if (!element.text() || element.text()->empty())
        return;

    const auto &family = font_family();
    if (!family)
        return;

    const int pixel_size = std::max(
        1,
        int(std::lround(element.stroke_width() * settings_.text_size_factor * transform.zoom())));

    QFont font(*family);
    font.setPixelSize(pixel_size);

    painter.save();
    painter.setFont(font);
    painter.setPen(to_qcolor(element.colour()));
    // the anchor is on the baseline at the left of the first glyph
    painter.drawText(
        to_qpoint(transform.to_device(element.anchor())),
        QString::fromStdString(*element.text()));
    painter.restore();
}
