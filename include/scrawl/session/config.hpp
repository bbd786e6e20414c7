// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <vector>

#include <Imath/ImathVec.h>

#include "scrawl/ui/canvas/hit_test.hpp"
#include "scrawl/ui/raster/canvas_renderer.hpp"
#include "scrawl/utility/colour.hpp"
#include "scrawl/utility/json_store.hpp"

namespace scrawl {
namespace session {

    // Font used for text when the preferences do not name one
    std::string default_font_path();

    /* Struct SessionConfig
    Every tunable of a drawing session. Values come from the preferences
    store under "/drawing/..." (see update_from_preferences); anything not
    set there keeps the default below. */
    struct SessionConfig {

        SessionConfig();

        // hit testing
        float hit_padding{10.0f};
        Imath::V2f text_hit_box{200.0f, 30.0f};

        // pinch zoom
        float min_zoom{1.0f};
        float max_zoom{5.0f};

        // display duration, seconds
        int default_duration{5};
        int min_duration{1};
        int max_duration{30};

        // tools
        utility::ColourTriplet default_colour{1.0f, 0.0f, 0.0f};
        float default_stroke_width{3.0f};
        std::vector<utility::ColourTriplet> palette;
        std::vector<float> stroke_widths{1.0f, 2.0f, 3.0f, 5.0f, 8.0f};
        float text_stroke_width{2.0f};

        // rendering
        float arrow_head_length{15.0f};
        float arrow_head_angle_degrees{30.0f};
        float text_size_factor{8.0f};
        float highlight_opacity{0.3f};
        float highlight_border_width{1.0f};
        std::string font_path;

        // drafts
        std::string draft_key_prefix{"drawing-draft-"};
        bool restore_drafts{true};

        // Throws std::invalid_argument if a value is out of range and
        // nlohmann::json::exception if a value has the wrong type. The
        // config is unchanged on failure.
        void update_from_preferences(const utility::JsonStore &prefs);

        // Read a preferences file, throws on failure
        static SessionConfig from_file(const std::string &path);

        [[nodiscard]] utility::JsonStore as_json() const;

        void validate() const;

        [[nodiscard]] int clamp_duration(const int seconds) const;
        [[nodiscard]] std::string draft_key(const std::string &target) const {
            return draft_key_prefix + target;
        }

        [[nodiscard]] ui::canvas::HitTestSettings hit_settings() const;
        [[nodiscard]] ui::raster::RenderSettings render_settings() const;
    };

} // namespace session
} // namespace scrawl
