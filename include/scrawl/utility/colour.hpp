// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include <Imath/ImathVec.h>
#include <nlohmann/json.hpp>

namespace scrawl {
namespace utility {

    // Linear RGB with components in 0-1
    class ColourTriplet : public Imath::V3f {
      public:
        ColourTriplet() : Imath::V3f(0.0f, 0.0f, 0.0f) {}
        ColourTriplet(const float r, const float g, const float b) : Imath::V3f(r, g, b) {}
        ColourTriplet(const ColourTriplet &o) = default;
        ColourTriplet &operator=(const ColourTriplet &o) = default;

        // Accepts "#RRGGBB" or "RRGGBB", throws std::invalid_argument otherwise.
        static ColourTriplet from_hex(const std::string &hex);

        // "#RRGGBB", upper case
        [[nodiscard]] std::string to_hex() const;

        [[nodiscard]] float red() const { return x; }
        [[nodiscard]] float green() const { return y; }
        [[nodiscard]] float blue() const { return z; }
    };

    void to_json(nlohmann::json &j, const ColourTriplet &c);
    void from_json(const nlohmann::json &j, ColourTriplet &c);

} // namespace utility
} // namespace scrawl
