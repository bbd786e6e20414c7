// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "scrawl/ui/canvas/element.hpp"
#include "scrawl/ui/canvas/layer.hpp"

namespace scrawl {
namespace session {

    /* Struct Draft
    Autosaved state of an open drawing, keyed by its target. */
    struct Draft {

        static constexpr int VERSION = 1;

        ui::canvas::ElementVec elements;
        ui::canvas::LayerVec layers;
        utility::Uuid current_layer_id;
        int duration{5};
        double timestamp{0.0};
        // ISO 8601, UTC
        std::string saved_at;
    };

    void to_json(nlohmann::json &j, const Draft &d);

    // Strict: throws on any problem
    void from_json(const nlohmann::json &j, Draft &d);

    // Lenient load of stored draft text. Elements of an unknown kind or
    // with bad data are skipped. Empty when the text does not parse, the
    // version differs or there are no usable layers.
    std::optional<Draft> parse_draft(const std::string &text);

    std::string utc_timestamp();

} // namespace session
} // namespace scrawl
