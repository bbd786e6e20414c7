// SPDX-License-Identifier: Apache-2.0

#include <stdexcept>

#include <fmt/format.h>

#include "scrawl/ui/canvas/element.hpp"
#include "scrawl/ui/helpers.hpp"

using namespace scrawl;
using namespace scrawl::ui::canvas;

std::optional<ElementKind> scrawl::ui::canvas::ElementKind_from_str(const std::string &name) {

    if (name == "freehand" || name == "pen")
        return ElementKind::Freehand;
    if (name == "rectangle")
        return ElementKind::Rectangle;
    if (name == "ellipse" || name == "circle")
        return ElementKind::Ellipse;
    if (name == "arrow")
        return ElementKind::Arrow;
    if (name == "text")
        return ElementKind::Text;
    if (name == "highlight")
        return ElementKind::Highlight;
    return {};
}

Element Element::Shape(
    const ElementKind kind,
    const Imath::V2f &anchor,
    const utility::ColourTriplet &colour,
    const float stroke_width,
    const utility::Uuid &layer_id) {

    Element e;
    e.kind_         = kind;
    e.colour_       = colour;
    e.stroke_width_ = stroke_width;
    e.layer_id_     = layer_id;
    e.points_.push_back(anchor);
    return e;
}

Element Element::Caption(
    const Imath::V2f &origin,
    const std::string &text,
    const utility::ColourTriplet &colour,
    const float stroke_width,
    const utility::Uuid &layer_id) {

    Element e = Shape(ElementKind::Text, origin, colour, stroke_width, layer_id);
    e.text_   = text;
    return e;
}

bool Element::operator==(const Element &o) const {
    return id_ == o.id_ && kind_ == o.kind_ && points_ == o.points_ && colour_ == o.colour_ &&
           stroke_width_ == o.stroke_width_ && text_ == o.text_ && layer_id_ == o.layer_id_;
}

void Element::add_point(const Imath::V2f &pt) {

    switch (kind_) {
    case ElementKind::Freehand:
        if (points_.empty() || points_.back() != pt)
            points_.push_back(pt);
        break;
    case ElementKind::Text:
        break;
    default:
        set_end_point(pt);
        break;
    }
}

void Element::set_end_point(const Imath::V2f &pt) {

    if (points_.empty()) {
        points_.push_back(pt);
        return;
    }
    points_.resize(1);
    points_.push_back(pt);
}

void Element::translate(const Imath::V2f &delta) {
    for (auto &pt : points_)
        pt += delta;
}

bool Element::is_degenerate() const {
    for (size_t i = 1; i < points_.size(); ++i) {
        if (points_[i] != points_.front())
            return false;
    }
    return true;
}

Imath::Box2f Element::bounding_box() const {
    Imath::Box2f b;
    for (const auto &pt : points_)
        b.extendBy(pt);
    return b;
}

void scrawl::ui::canvas::from_json(const nlohmann::json &j, Element &e) {

    const auto kind_name = j.at("kind").get<std::string>();
    const auto kind      = ElementKind_from_str(kind_name);
    if (!kind)
        throw std::runtime_error(fmt::format("Unknown element kind \"{}\"", kind_name));

    e.id_           = j.at("id").get<utility::Uuid>();
    e.kind_         = *kind;
    e.layer_id_     = j.at("layer_id").get<utility::Uuid>();
    e.colour_       = j.at("colour").get<utility::ColourTriplet>();
    e.stroke_width_ = j.at("stroke_width").get<float>();

    e.text_.reset();
    if (j.contains("text") && j["text"].is_string())
        e.text_ = j["text"].get<std::string>();

    // flat x,y list
    const auto &pts = j.at("points");
    if (!pts.is_array() || pts.size() % 2)
        throw std::runtime_error("Element points must be a flat list of x,y pairs");

    e.points_.clear();
    for (size_t i = 0; i < pts.size(); i += 2) {
        e.points_.emplace_back(pts[i].get<float>(), pts[i + 1].get<float>());
    }

    if (e.points_.empty())
        throw std::runtime_error("Element has no points");
    if (e.kind_ == ElementKind::Text && !e.text_)
        throw std::runtime_error("Text element has no text");
    if (is_two_point_kind(e.kind_) && e.points_.size() > 2)
        e.points_.erase(e.points_.begin() + 1, e.points_.end() - 1);
}

void scrawl::ui::canvas::to_json(nlohmann::json &j, const Element &e) {

    std::vector<float> pts;
    pts.reserve(e.points_.size() * 2);
    for (const auto &pt : e.points_) {
        pts.push_back(pt.x);
        pts.push_back(pt.y);
    }

    j = nlohmann::json{
        {"id", e.id_},
        {"kind", std::string(ElementKind_to_str(e.kind_))},
        {"points", pts},
        {"colour", e.colour_},
        {"stroke_width", e.stroke_width_},
        {"layer_id", e.layer_id_}};

    if (e.text_)
        j["text"] = *e.text_;
}
