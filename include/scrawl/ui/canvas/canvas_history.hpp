// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vector>

#include "scrawl/ui/canvas/element.hpp"


namespace scrawl {
namespace ui {
    namespace canvas {

        /* Class CanvasHistory
        Linear undo/redo over full copies of the element set. The cursor
        points at the snapshot matching the live state; index 0 is the state
        the session was opened (or restored) with. Committing after some undos
        discards the redo branch. */
        class CanvasHistory {

          public:
            using Snapshot = ElementVec;

            CanvasHistory() : snapshots_(1) {}

            void commit(const Snapshot &snapshot);

            // Step back/forward, false at either end with nothing changed
            bool undo();
            bool redo();

            [[nodiscard]] const Snapshot &current() const { return snapshots_[cursor_]; }
            [[nodiscard]] bool can_undo() const { return cursor_ > 0; }
            [[nodiscard]] bool can_redo() const { return cursor_ + 1 < snapshots_.size(); }
            [[nodiscard]] size_t cursor() const { return cursor_; }
            [[nodiscard]] size_t size() const { return snapshots_.size(); }

            // Drop everything and start again from a single snapshot
            void reset(const Snapshot &seed = Snapshot());

          private:
            std::vector<Snapshot> snapshots_;
            size_t cursor_{0};
        };

    } // end namespace canvas
} // end namespace ui
} // end namespace scrawl
