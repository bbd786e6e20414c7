// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "scrawl/utility/colour.hpp"

using namespace scrawl::utility;

namespace {

int channel(const std::string &hex, const size_t pos) {
    const auto v = std::stoi(hex.substr(pos, 2), nullptr, 16);
    return std::clamp(v, 0, 255);
}

int quantise(const float v) {
    return static_cast<int>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

} // anonymous namespace

ColourTriplet ColourTriplet::from_hex(const std::string &_hex) {

    const std::string hex = !_hex.empty() && _hex[0] == '#' ? _hex.substr(1) : _hex;
    if (hex.size() != 6 ||
        hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
        throw std::invalid_argument(fmt::format("Invalid hex colour \"{}\"", _hex));
    }

    return ColourTriplet(
        float(channel(hex, 0)) / 255.0f,
        float(channel(hex, 2)) / 255.0f,
        float(channel(hex, 4)) / 255.0f);
}

std::string ColourTriplet::to_hex() const {
    return fmt::format("#{:02X}{:02X}{:02X}", quantise(x), quantise(y), quantise(z));
}

void scrawl::utility::to_json(nlohmann::json &j, const ColourTriplet &c) { j = c.to_hex(); }

void scrawl::utility::from_json(const nlohmann::json &j, ColourTriplet &c) {
    if (j.is_string()) {
        c = ColourTriplet::from_hex(j.get<std::string>());
    } else {
        c = ColourTriplet{j.value("r", 1.0f), j.value("g", 1.0f), j.value("b", 1.0f)};
    }
}
