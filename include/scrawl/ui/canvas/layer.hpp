// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "scrawl/utility/uuid.hpp"


namespace scrawl {
namespace ui {
    namespace canvas {

        struct Layer {

            Layer() : id(utility::Uuid::generate()) {}
            Layer(std::string _name) : id(utility::Uuid::generate()), name(std::move(_name)) {}

            bool operator==(const Layer &o) const {
                return id == o.id && name == o.name && visible == o.visible &&
                       locked == o.locked;
            }
            bool operator!=(const Layer &o) const { return !(*this == o); }

            utility::Uuid id;
            std::string name;
            bool visible{true};
            bool locked{false};
        };

        using LayerVec = std::vector<Layer>;

        void from_json(const nlohmann::json &j, Layer &l);
        void to_json(nlohmann::json &j, const Layer &l);

    } // end namespace canvas
} // end namespace ui
} // end namespace scrawl
