// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "scrawl/ui/canvas/canvas.hpp"

using namespace scrawl;
using namespace scrawl::ui;
using namespace scrawl::ui::canvas;

namespace {

std::string trimmed(const std::string &s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return std::string();
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // anonymous namespace

Canvas::Canvas() { reset(); }

void Canvas::reset() {
    elements_.clear();
    layers_.clear();
    layers_.emplace_back("Layer 1");
    current_layer_id_ = layers_.front().id;
}

const Layer &Canvas::current_layer() const {
    // current_layer_id_ always refers to an existing layer
    const auto l = layer(current_layer_id_);
    return l ? *l : layers_.front();
}

const Layer *Canvas::layer(const utility::Uuid &id) const {
    for (const auto &l : layers_) {
        if (l.id == id)
            return &l;
    }
    return nullptr;
}

Layer &Canvas::layer_ref(const utility::Uuid &id) {
    for (auto &l : layers_) {
        if (l.id == id)
            return l;
    }
    throw RejectedEdit(fmt::format("Unknown layer {}", to_string(id)));
}

const Element *Canvas::element(const utility::Uuid &id) const {
    for (const auto &e : elements_) {
        if (e.id() == id)
            return &e;
    }
    return nullptr;
}

int Canvas::layer_index(const utility::Uuid &id) const {
    for (size_t i = 0; i < layers_.size(); ++i) {
        if (layers_[i].id == id)
            return int(i);
    }
    return -1;
}

size_t Canvas::element_count(const utility::Uuid &layer_id) const {
    return std::count_if(elements_.begin(), elements_.end(), [&layer_id](const Element &e) {
        return e.layer_id() == layer_id;
    });
}

void Canvas::append_element(const Element &element) {

    const auto &l = layer_ref(element.layer_id());
    if (l.locked)
        throw RejectedEdit(fmt::format("Layer \"{}\" is locked", l.name));

    elements_.push_back(element);
}

void Canvas::replace_element(const Element &element) {

    auto p = std::find_if(elements_.begin(), elements_.end(), [&element](const Element &e) {
        return e.id() == element.id();
    });
    if (p == elements_.end())
        throw RejectedEdit(fmt::format("Unknown element {}", to_string(element.id())));

    for (const auto &id : {p->layer_id(), element.layer_id()}) {
        const auto &l = layer_ref(id);
        if (l.locked)
            throw RejectedEdit(fmt::format("Layer \"{}\" is locked", l.name));
    }

    *p = element;
}

void Canvas::set_elements(ElementVec elements) {

    for (auto &e : elements) {
        if (!layer(e.layer_id())) {
            spdlog::debug(
                "{} moving element {} from missing layer onto {}",
                __PRETTY_FUNCTION__,
                to_string(e.id()),
                current_layer().name);
            e.set_layer_id(current_layer_id_);
        }
    }
    elements_ = std::move(elements);
}

std::string Canvas::next_layer_name() const {
    size_t n = layers_.size() + 1;
    while (name_in_use(fmt::format("Layer {}", n), utility::Uuid()))
        n++;
    return fmt::format("Layer {}", n);
}

bool Canvas::name_in_use(const std::string &name, const utility::Uuid &except) const {
    return std::any_of(layers_.begin(), layers_.end(), [&](const Layer &l) {
        return l.id != except && l.name == name;
    });
}

const Layer &Canvas::create_layer() {
    layers_.emplace_back(next_layer_name());
    current_layer_id_ = layers_.back().id;
    return layers_.back();
}

void Canvas::select_layer(const utility::Uuid &id) { current_layer_id_ = layer_ref(id).id; }

void Canvas::toggle_layer_visibility(const utility::Uuid &id) {
    auto &l   = layer_ref(id);
    l.visible = !l.visible;
}

void Canvas::toggle_layer_lock(const utility::Uuid &id) {
    auto &l  = layer_ref(id);
    l.locked = !l.locked;
}

void Canvas::rename_layer(const utility::Uuid &id, const std::string &_name) {

    auto &l                = layer_ref(id);
    const std::string name = trimmed(_name);

    if (name.empty())
        throw RejectedEdit("Layer name cannot be empty");
    if (name_in_use(name, id))
        throw RejectedEdit(fmt::format("A layer named \"{}\" already exists", name));

    l.name = name;
}

void Canvas::move_layer(const size_t from, const size_t to) {

    if (from >= layers_.size() || to >= layers_.size())
        throw RejectedEdit(fmt::format("Cannot move layer from {} to {}", from, to));
    if (from == to)
        return;

    Layer l = layers_[from];
    layers_.erase(layers_.begin() + from);
    layers_.insert(layers_.begin() + to, l);
}

size_t Canvas::delete_layer(const utility::Uuid &id) {

    layer_ref(id);

    if (layers_.size() == 1)
        throw RejectedEdit("Cannot delete the last layer");

    const size_t before = elements_.size();
    elements_.erase(
        std::remove_if(
            elements_.begin(),
            elements_.end(),
            [&id](const Element &e) { return e.layer_id() == id; }),
        elements_.end());

    layers_.erase(layers_.begin() + layer_index(id));

    if (current_layer_id_ == id)
        current_layer_id_ = layers_.front().id;

    return before - elements_.size();
}

size_t Canvas::merge_layers(
    const utility::Uuid &target, const std::vector<utility::Uuid> &sources) {

    layer_ref(target);

    std::set<utility::Uuid> to_merge;
    for (const auto &id : sources) {
        layer_ref(id);
        if (id != target)
            to_merge.insert(id);
    }

    if (to_merge.empty())
        throw RejectedEdit("Select at least two layers to merge");

    size_t moved = 0;
    for (auto &e : elements_) {
        if (to_merge.count(e.layer_id())) {
            e.set_layer_id(target);
            moved++;
        }
    }

    layers_.erase(
        std::remove_if(
            layers_.begin(),
            layers_.end(),
            [&to_merge](const Layer &l) { return to_merge.count(l.id) != 0; }),
        layers_.end());

    if (to_merge.count(current_layer_id_))
        current_layer_id_ = target;

    return moved;
}

std::vector<const Element *> Canvas::paint_order() const {

    std::vector<const Element *> result;
    result.reserve(elements_.size());
    for (const auto &l : layers_) {
        if (!l.visible)
            continue;
        for (const auto &e : elements_) {
            if (e.layer_id() == l.id)
                result.push_back(&e);
        }
    }
    return result;
}

void Canvas::restore(
    const LayerVec &layers, const ElementVec &elements, const utility::Uuid &current_layer_id) {

    if (layers.empty())
        throw std::runtime_error("Canvas must have at least one layer");

    std::set<utility::Uuid> ids;
    for (const auto &l : layers) {
        if (!ids.insert(l.id).second)
            throw std::runtime_error(fmt::format("Duplicate layer id {}", to_string(l.id)));
    }

    layers_ = layers;
    elements_.clear();
    for (const auto &e : elements) {
        if (ids.count(e.layer_id())) {
            elements_.push_back(e);
        } else {
            spdlog::warn(
                "{} dropping element {} on missing layer {}",
                __PRETTY_FUNCTION__,
                to_string(e.id()),
                to_string(e.layer_id()));
        }
    }

    current_layer_id_ = ids.count(current_layer_id) ? current_layer_id : layers_.front().id;
}
