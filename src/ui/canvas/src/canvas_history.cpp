// SPDX-License-Identifier: Apache-2.0

#include "scrawl/ui/canvas/canvas_history.hpp"

using namespace scrawl::ui::canvas;

void CanvasHistory::commit(const Snapshot &snapshot) {

    // if some undos have been done, our position in the history is not at
    // the head. Erase the redoable snapshots before appending.
    snapshots_.erase(snapshots_.begin() + cursor_ + 1, snapshots_.end());
    snapshots_.push_back(snapshot);
    cursor_ = snapshots_.size() - 1;
}

bool CanvasHistory::undo() {
    if (!can_undo())
        return false;
    cursor_--;
    return true;
}

bool CanvasHistory::redo() {
    if (!can_redo())
        return false;
    cursor_++;
    return true;
}

void CanvasHistory::reset(const Snapshot &seed) {
    snapshots_.clear();
    snapshots_.push_back(seed);
    cursor_ = 0;
}
