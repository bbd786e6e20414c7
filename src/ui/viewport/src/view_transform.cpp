// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "scrawl/ui/viewport/view_transform.hpp"

using namespace scrawl::ui::viewport;

ViewTransform::ViewTransform(const float min_zoom, const float max_zoom)
    : min_zoom_(min_zoom), max_zoom_(max_zoom) {
    set_zoom_range(min_zoom, max_zoom);
}

Imath::V2f ViewTransform::to_surface(const Imath::V2f &device) const {
    return (device - origin_ - pan_) / zoom_;
}

Imath::V2f ViewTransform::to_device(const Imath::V2f &surface) const {
    return surface * zoom_ + origin_ + pan_;
}

void ViewTransform::set_zoom_range(const float min_zoom, const float max_zoom) {

    if (min_zoom <= 0.0f || max_zoom < min_zoom) {
        throw std::invalid_argument(
            fmt::format("Invalid zoom range [{}, {}]", min_zoom, max_zoom));
    }
    min_zoom_ = min_zoom;
    max_zoom_ = max_zoom;
    set_zoom(zoom_);
}

void ViewTransform::set_zoom(const float zoom) {
    zoom_ = std::clamp(zoom, min_zoom_, max_zoom_);
    if (!is_zoomed())
        pan_ = Imath::V2f(0.0f, 0.0f);
}

void ViewTransform::set_pan(const Imath::V2f &pan) {
    if (is_zoomed())
        pan_ = pan;
}

void ViewTransform::begin_pinch(const Imath::V2f &contact1, const Imath::V2f &contact2) {
    pan_anchor_.reset();
    pinch_ = Pinch{(contact1 + contact2) * 0.5f, (contact1 - contact2).length()};
}

void ViewTransform::update_pinch(const Imath::V2f &contact1, const Imath::V2f &contact2) {

    if (!pinch_) {
        begin_pinch(contact1, contact2);
        return;
    }

    const Imath::V2f midpoint = (contact1 + contact2) * 0.5f;
    const float distance      = (contact1 - contact2).length();

    // contacts on top of each other, wait for them to separate
    if (pinch_->distance <= 0.0f || distance <= 0.0f) {
        pinch_ = Pinch{midpoint, distance};
        return;
    }

    // keep the surface point under the previous midpoint under the new one
    const Imath::V2f anchor = to_surface(pinch_->midpoint);
    zoom_                   = std::clamp(zoom_ * distance / pinch_->distance, min_zoom_, max_zoom_);

    if (is_zoomed()) {
        pan_ = midpoint - origin_ - anchor * zoom_;
    } else {
        pan_ = Imath::V2f(0.0f, 0.0f);
    }

    spdlog::debug("{} zoom {} pan {},{}", __PRETTY_FUNCTION__, zoom_, pan_.x, pan_.y);

    pinch_ = Pinch{midpoint, distance};
}

void ViewTransform::end_pinch() { pinch_.reset(); }

void ViewTransform::begin_pan(const Imath::V2f &device) {
    if (is_zoomed())
        pan_anchor_ = device;
}

void ViewTransform::update_pan(const Imath::V2f &device) {

    if (!pan_anchor_ || !is_zoomed())
        return;

    pan_ += device - *pan_anchor_;
    pan_anchor_ = device;
}

void ViewTransform::end_pan() { pan_anchor_.reset(); }

void ViewTransform::reset() {
    zoom_ = min_zoom_;
    pan_  = Imath::V2f(0.0f, 0.0f);
    pinch_.reset();
    pan_anchor_.reset();
}
