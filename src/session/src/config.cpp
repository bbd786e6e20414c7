// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "scrawl/session/config.hpp"

using namespace scrawl;
using namespace scrawl::session;

#ifndef SCRAWL_DEFAULT_FONT
#define SCRAWL_DEFAULT_FONT "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"
#endif

std::string scrawl::session::default_font_path() { return SCRAWL_DEFAULT_FONT; }

SessionConfig::SessionConfig()
    : palette(
          {utility::ColourTriplet(1.0f, 0.0f, 0.0f),
           utility::ColourTriplet(0.0f, 1.0f, 0.0f),
           utility::ColourTriplet(0.0f, 0.0f, 1.0f),
           utility::ColourTriplet(1.0f, 1.0f, 0.0f),
           utility::ColourTriplet(1.0f, 0.0f, 1.0f),
           utility::ColourTriplet(0.0f, 1.0f, 1.0f),
           utility::ColourTriplet(1.0f, 1.0f, 1.0f),
           utility::ColourTriplet(0.0f, 0.0f, 0.0f)}),
      font_path(default_font_path()) {}

void SessionConfig::update_from_preferences(const utility::JsonStore &prefs) {

    SessionConfig c = *this;

    c.hit_padding = prefs.get_or("/drawing/hit_padding", c.hit_padding);
    if (prefs.has("/drawing/text_hit_box")) {
        const auto box = prefs.get("/drawing/text_hit_box");
        c.text_hit_box = Imath::V2f(box.at(0).get<float>(), box.at(1).get<float>());
    }

    c.min_zoom = prefs.get_or("/drawing/zoom/min", c.min_zoom);
    c.max_zoom = prefs.get_or("/drawing/zoom/max", c.max_zoom);

    c.default_duration = prefs.get_or("/drawing/duration/default", c.default_duration);
    c.min_duration     = prefs.get_or("/drawing/duration/min", c.min_duration);
    c.max_duration     = prefs.get_or("/drawing/duration/max", c.max_duration);

    c.default_colour = prefs.get_or("/drawing/tools/default_colour", c.default_colour);
    c.default_stroke_width =
        prefs.get_or("/drawing/tools/default_stroke_width", c.default_stroke_width);
    c.palette           = prefs.get_or("/drawing/tools/palette", c.palette);
    c.stroke_widths     = prefs.get_or("/drawing/tools/stroke_widths", c.stroke_widths);
    c.text_stroke_width = prefs.get_or("/drawing/tools/text_stroke_width", c.text_stroke_width);

    c.arrow_head_length = prefs.get_or("/drawing/render/arrow_head_length", c.arrow_head_length);
    c.arrow_head_angle_degrees =
        prefs.get_or("/drawing/render/arrow_head_angle", c.arrow_head_angle_degrees);
    c.text_size_factor = prefs.get_or("/drawing/render/text_size_factor", c.text_size_factor);
    c.highlight_opacity =
        prefs.get_or("/drawing/render/highlight_opacity", c.highlight_opacity);
    c.highlight_border_width =
        prefs.get_or("/drawing/render/highlight_border_width", c.highlight_border_width);
    c.font_path = prefs.get_or("/drawing/render/font_path", c.font_path);

    c.draft_key_prefix = prefs.get_or("/drawing/draft/key_prefix", c.draft_key_prefix);
    c.restore_drafts   = prefs.get_or("/drawing/draft/restore", c.restore_drafts);

    c.validate();
    *this = c;
}

SessionConfig SessionConfig::from_file(const std::string &path) {
    SessionConfig c;
    c.update_from_preferences(utility::open_json(path));
    return c;
}

void SessionConfig::validate() const {

    if (hit_padding < 0.0f)
        throw std::invalid_argument(fmt::format("hit_padding {} is negative", hit_padding));
    if (min_zoom <= 0.0f || max_zoom < min_zoom)
        throw std::invalid_argument(fmt::format("Invalid zoom range [{}, {}]", min_zoom, max_zoom));
    if (min_duration < 1 || max_duration < min_duration)
        throw std::invalid_argument(
            fmt::format("Invalid duration range [{}, {}]", min_duration, max_duration));
    if (default_duration < min_duration || default_duration > max_duration)
        throw std::invalid_argument(
            fmt::format("Default duration {} outside [{}, {}]", default_duration, min_duration, max_duration));
    if (default_stroke_width <= 0.0f || text_stroke_width <= 0.0f)
        throw std::invalid_argument("Stroke widths must be positive");
    if (std::any_of(stroke_widths.begin(), stroke_widths.end(), [](float w) { return w <= 0.0f; }))
        throw std::invalid_argument("Stroke width presets must be positive");
    if (highlight_opacity < 0.0f || highlight_opacity > 1.0f)
        throw std::invalid_argument(
            fmt::format("highlight_opacity {} outside [0, 1]", highlight_opacity));
    if (draft_key_prefix.empty())
        throw std::invalid_argument("Draft key prefix cannot be empty");
}

utility::JsonStore SessionConfig::as_json() const {

    utility::JsonStore j;
    j.set(hit_padding, "/drawing/hit_padding");
    j.set(nlohmann::json::array({text_hit_box.x, text_hit_box.y}), "/drawing/text_hit_box");
    j.set(min_zoom, "/drawing/zoom/min");
    j.set(max_zoom, "/drawing/zoom/max");
    j.set(default_duration, "/drawing/duration/default");
    j.set(min_duration, "/drawing/duration/min");
    j.set(max_duration, "/drawing/duration/max");
    j.set(default_colour, "/drawing/tools/default_colour");
    j.set(default_stroke_width, "/drawing/tools/default_stroke_width");
    j.set(palette, "/drawing/tools/palette");
    j.set(stroke_widths, "/drawing/tools/stroke_widths");
    j.set(text_stroke_width, "/drawing/tools/text_stroke_width");
    j.set(arrow_head_length, "/drawing/render/arrow_head_length");
    j.set(arrow_head_angle_degrees, "/drawing/render/arrow_head_angle");
    j.set(text_size_factor, "/drawing/render/text_size_factor");
    j.set(highlight_opacity, "/drawing/render/highlight_opacity");
    j.set(highlight_border_width, "/drawing/render/highlight_border_width");
    j.set(font_path, "/drawing/render/font_path");
    j.set(draft_key_prefix, "/drawing/draft/key_prefix");
    j.set(restore_drafts, "/drawing/draft/restore");
    return j;
}

int SessionConfig::clamp_duration(const int seconds) const {
    return std::clamp(seconds, min_duration, max_duration);
}

ui::canvas::HitTestSettings SessionConfig::hit_settings() const {
    ui::canvas::HitTestSettings s;
    s.padding  = hit_padding;
    s.text_box = text_hit_box;
    return s;
}

ui::raster::RenderSettings SessionConfig::render_settings() const {
    ui::raster::RenderSettings s;
    s.arrow_head_length      = arrow_head_length;
    s.arrow_head_angle       = arrow_head_angle_degrees * float(M_PI) / 180.0f;
    s.highlight_opacity      = highlight_opacity;
    s.highlight_border_width = highlight_border_width;
    s.text_size_factor       = text_size_factor;
    s.font_path              = font_path;
    return s;
}
