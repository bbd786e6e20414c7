// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <vector>

#include <Imath/ImathBox.h>
#include <Imath/ImathVec.h>

namespace scrawl {
namespace utility {

    // Perpendicular distance from p to the segment a-b. A zero length
    // segment is treated as the point a.
    inline float
    distance_to_segment(const Imath::V2f &p, const Imath::V2f &a, const Imath::V2f &b) {

        const Imath::V2f ab = b - a;
        const float len2    = ab.length2();
        if (len2 == 0.0f)
            return (p - a).length();

        const float t = std::clamp((p - a).dot(ab) / len2, 0.0f, 1.0f);
        return (p - (a + ab * t)).length();
    }

    // Smallest distance from p to any consecutive pair of points
    inline float
    distance_to_polyline(const Imath::V2f &p, const std::vector<Imath::V2f> &points) {

        if (points.empty())
            return std::numeric_limits<float>::max();
        if (points.size() == 1)
            return (p - points.front()).length();

        float result = std::numeric_limits<float>::max();
        for (size_t i = 1; i < points.size(); ++i) {
            result = std::min(result, distance_to_segment(p, points[i - 1], points[i]));
        }
        return result;
    }

    // Axis aligned box spanned by two opposite corners, in any order
    inline Imath::Box2f corner_box(const Imath::V2f &corner1, const Imath::V2f &corner2) {
        Imath::Box2f b;
        b.extendBy(corner1);
        b.extendBy(corner2);
        return b;
    }

    inline bool
    point_in_box(const Imath::V2f &p, const Imath::Box2f &box, const float padding = 0.0f) {
        return p.x >= box.min.x - padding && p.x <= box.max.x + padding &&
               p.y >= box.min.y - padding && p.y <= box.max.y + padding;
    }

    // Point against the ellipse inscribed in the box spanned by two corners.
    // Always false for an ellipse with a zero radius.
    inline bool point_in_ellipse(
        const Imath::V2f &p, const Imath::V2f &corner1, const Imath::V2f &corner2) {

        const Imath::V2f centre = (corner1 + corner2) * 0.5f;
        const float rx          = std::abs(corner2.x - corner1.x) * 0.5f;
        const float ry          = std::abs(corner2.y - corner1.y) * 0.5f;
        if (rx <= 0.0f || ry <= 0.0f)
            return false;

        const float nx = (p.x - centre.x) / rx;
        const float ny = (p.y - centre.y) / ry;
        return nx * nx + ny * ny <= 1.0f;
    }

    // The two arrowhead wing tips for an arrow pointing from start to end.
    // Each wing is length long and sits at +/- angle (radians) from the
    // shaft. A zero length arrow points along +x.
    inline std::array<Imath::V2f, 2> arrow_head(
        const Imath::V2f &start,
        const Imath::V2f &end,
        const float length,
        const float angle = float(M_PI / 6.0)) {

        const float shaft = start == end ? 0.0f : std::atan2(end.y - start.y, end.x - start.x);

        return {
            end - Imath::V2f(std::cos(shaft - angle), std::sin(shaft - angle)) * length,
            end - Imath::V2f(std::cos(shaft + angle), std::sin(shaft + angle)) * length};
    }

} // namespace utility
} // namespace scrawl
