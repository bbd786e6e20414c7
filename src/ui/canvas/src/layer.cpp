// SPDX-License-Identifier: Apache-2.0

#include "scrawl/ui/canvas/layer.hpp"

using namespace scrawl::ui::canvas;

void scrawl::ui::canvas::from_json(const nlohmann::json &j, Layer &l) {
    j.at("id").get_to(l.id);
    j.at("name").get_to(l.name);
    l.visible = j.value("visible", true);
    l.locked  = j.value("locked", false);
}

void scrawl::ui::canvas::to_json(nlohmann::json &j, const Layer &l) {
    j = nlohmann::json{
        {"id", l.id}, {"name", l.name}, {"visible", l.visible}, {"locked", l.locked}};
}
