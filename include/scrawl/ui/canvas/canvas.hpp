// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "scrawl/ui/canvas/element.hpp"
#include "scrawl/ui/canvas/layer.hpp"


namespace scrawl {
namespace ui {
    namespace canvas {

        // Thrown when an edit is refused because of the state of the model
        // (locked layer, bad layer name, last layer, ...). The model is left
        // unchanged.
        class RejectedEdit : public std::runtime_error {
          public:
            using std::runtime_error::runtime_error;
        };

        /* Class Canvas
        The committed annotation model: an ordered list of layers and the
        elements drawn on them. Layer order is paint order, index 0 is at the
        back. Elements are kept in one list in insertion order; each refers
        to its layer by id.

        The canvas always holds at least one layer, and every element refers
        to a layer that exists. All layer operations keep both invariants in
        the same call. */
        class Canvas {

          public:
            Canvas();
            Canvas(const Canvas &o) = default;
            Canvas &operator=(const Canvas &o) = default;

            bool operator==(const Canvas &o) const {
                return elements_ == o.elements_ && layers_ == o.layers_ &&
                       current_layer_id_ == o.current_layer_id_;
            }

            ElementVec::const_iterator begin() const { return elements_.begin(); }
            ElementVec::const_iterator end() const { return elements_.end(); }

            [[nodiscard]] const ElementVec &elements() const { return elements_; }
            [[nodiscard]] const LayerVec &layers() const { return layers_; }
            [[nodiscard]] bool empty() const { return elements_.empty(); }
            [[nodiscard]] size_t size() const { return elements_.size(); }

            [[nodiscard]] const utility::Uuid &current_layer_id() const {
                return current_layer_id_;
            }
            [[nodiscard]] const Layer &current_layer() const;

            // nullptr when absent
            [[nodiscard]] const Layer *layer(const utility::Uuid &id) const;
            [[nodiscard]] const Element *element(const utility::Uuid &id) const;
            [[nodiscard]] int layer_index(const utility::Uuid &id) const;
            [[nodiscard]] size_t element_count(const utility::Uuid &layer_id) const;

            // Elements

            // Throws RejectedEdit if the element's layer is missing or locked
            void append_element(const Element &element);

            // Replace the element with the same id. Throws RejectedEdit if it
            // does not exist or its layer is locked.
            void replace_element(const Element &element);

            // Swap in a whole element set (history restore). Elements whose
            // layer no longer exists are moved onto the current layer.
            void set_elements(ElementVec elements);

            void clear_elements() { elements_.clear(); }

            // Layers

            // Appends "Layer N" (first unused N) on top and makes it current
            const Layer &create_layer();
            void select_layer(const utility::Uuid &id);
            void toggle_layer_visibility(const utility::Uuid &id);
            void toggle_layer_lock(const utility::Uuid &id);
            void rename_layer(const utility::Uuid &id, const std::string &name);
            void move_layer(const size_t from, const size_t to);

            // Removes the layer with its elements, returns the number of
            // elements removed.
            size_t delete_layer(const utility::Uuid &id);

            // Moves the elements of every source layer onto target and
            // removes the sources. Returns the number of elements moved.
            size_t merge_layers(
                const utility::Uuid &target, const std::vector<utility::Uuid> &sources);

            // Visible elements, back to front
            [[nodiscard]] std::vector<const Element *> paint_order() const;

            // Load a persisted model. Throws std::runtime_error when layers is
            // empty or holds duplicate ids. Orphaned elements are dropped.
            void restore(
                const LayerVec &layers,
                const ElementVec &elements,
                const utility::Uuid &current_layer_id);

            // One empty layer, no elements
            void reset();

          private:
            Layer &layer_ref(const utility::Uuid &id);
            [[nodiscard]] std::string next_layer_name() const;
            [[nodiscard]] bool name_in_use(const std::string &name, const utility::Uuid &except) const;

          private:
            LayerVec layers_;
            ElementVec elements_;
            utility::Uuid current_layer_id_;
        };

    } // end namespace canvas
} // end namespace ui
} // end namespace scrawl
