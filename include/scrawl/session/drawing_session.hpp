// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <Imath/ImathVec.h>

#include "scrawl/session/config.hpp"
#include "scrawl/session/draft.hpp"
#include "scrawl/session/draft_store.hpp"
#include "scrawl/session/notice.hpp"
#include "scrawl/ui/canvas/canvas.hpp"
#include "scrawl/ui/canvas/canvas_history.hpp"
#include "scrawl/ui/canvas/canvas_interaction.hpp"
#include "scrawl/ui/mouse.hpp"
#include "scrawl/ui/raster/canvas_renderer.hpp"
#include "scrawl/ui/viewport/view_transform.hpp"

namespace scrawl {
namespace session {

    // What the host receives when a drawing is saved
    struct FlattenResult {
        std::vector<uint8_t> png;
        // whole seconds, rounded down
        int timestamp{0};
        // seconds, clamped to the configured range
        int duration{0};
    };

    /* Struct HostCallbacks
    Everything the engine needs from the application embedding it. Any
    callback may be left empty. */
    struct HostCallbacks {

        // Report the outcome of a save, once. Safe to call after the session
        // has been destroyed.
        using SaveCompletion = std::function<void(bool success, const std::string &error)>;

        std::function<void(
            const std::vector<uint8_t> &png,
            int timestamp,
            int duration,
            SaveCompletion completion)>
            on_save;

        std::function<void(bool drawing)> on_drawing_mode_change;
        std::function<void()> pause_playback;
        std::function<void(const Notice &)> on_notice;

        // Asked before unsaved elements are thrown away. Discards if empty.
        std::function<bool()> confirm_discard;
    };

    /* Class DrawingSession
    The annotation engine for one drawing surface. Owns the canvas, its
    undo history and the pointer interaction state, autosaves drafts to a
    DraftStore and hands the flattened image to the host on save.

    Everything is single threaded: call it from one thread only. Methods
    that can be refused return false and raise a Notice through
    HostCallbacks::on_notice. */
    class DrawingSession {

      public:
        DrawingSession(
            SessionConfig config, DraftStorePtr draft_store, HostCallbacks callbacks = {});
        ~DrawingSession();

        DrawingSession(const DrawingSession &) = delete;
        DrawingSession &operator=(const DrawingSession &) = delete;

        // Lifecycle

        // Show the drawing surface for target at the given video time.
        // Pauses playback, and restores a stored draft if there is nothing
        // drawn yet.
        bool open(
            const std::string &target, const double timestamp, const Imath::V2i &surface_size);

        // Hide the surface. Throws away anything drawn, after asking the host
        // if there is something to lose. The stored draft is kept. Returns
        // false if the host said no.
        bool close();

        [[nodiscard]] bool is_open() const { return open_; }

        void resize(const Imath::V2i &surface_size);
        void set_surface_origin(const Imath::V2f &origin);

        // Input

        void pointer_event(const ui::PointerEvent &event);

        // Tools

        void set_tool(const ui::canvas::Tool tool);
        bool set_colour(const utility::ColourTriplet &colour);
        bool set_stroke_width(const float width);
        void set_duration(const int seconds);

        bool confirm_text(const std::string &text);
        void cancel_text();

        // History

        bool undo();
        bool redo();

        // Remove every element and start the history again
        void clear();

        // Layers

        bool create_layer();
        bool select_layer(const utility::Uuid &id);
        bool toggle_layer_visibility(const utility::Uuid &id);
        bool toggle_layer_lock(const utility::Uuid &id);
        bool rename_layer(const utility::Uuid &id, const std::string &name);
        bool move_layer(const size_t from, const size_t to);
        bool delete_layer(const utility::Uuid &id);
        bool merge_layers(const utility::Uuid &target, const std::vector<utility::Uuid> &sources);

        // Output

        // Submit the flattened drawing to the host. On success the session
        // clears its state and closes, unless the drawing changed after it
        // was submitted; on failure nothing changes. Closing the session
        // abandons a save in flight.
        bool save();
        [[nodiscard]] bool save_in_progress() const { return save_in_flight_; }

        // What the user sees: current zoom and pan, working element on top
        [[nodiscard]] QImage render() const;

        // Committed elements only, unzoomed, encoded as PNG
        [[nodiscard]] FlattenResult flatten() const;

        // State

        [[nodiscard]] const ui::canvas::Canvas &canvas() const { return canvas_; }
        [[nodiscard]] const ui::canvas::CanvasHistory &history() const { return history_; }
        [[nodiscard]] const ui::canvas::CanvasInteraction &interaction() const {
            return interaction_;
        }
        [[nodiscard]] const ui::viewport::ViewTransform &view_transform() const { return view_; }
        [[nodiscard]] const SessionConfig &config() const { return config_; }
        [[nodiscard]] const std::string &target() const { return target_; }
        [[nodiscard]] double timestamp() const { return timestamp_; }
        [[nodiscard]] int duration() const { return duration_; }
        [[nodiscard]] const Imath::V2i &surface_size() const { return surface_size_; }
        [[nodiscard]] bool has_unsaved_changes() const { return !canvas_.empty(); }

        [[nodiscard]] Draft make_draft() const;

        void update_config(const SessionConfig &config);

      private:
        void handle_gesture(const ui::PointerEvent &event);
        void handle_pointer(const ui::PointerEvent &event);
        void handle_outcome(const ui::canvas::CanvasInteraction::Outcome outcome);

        template <typename F> bool layer_op(F &&op);

        void commit_snapshot();
        // every change to the drawing goes through here
        void state_changed();
        void write_draft();
        void restore_draft();
        void reset_state();
        void finish_close();
        void on_save_complete(
            const uint64_t id,
            const std::string &draft_key,
            const int duration,
            const bool success,
            const std::string &error);

        void notify(const NoticeType type, const std::string &message, const bool retryable = false);

      private:
        SessionConfig config_;
        DraftStorePtr draft_store_;
        HostCallbacks callbacks_;

        ui::canvas::Canvas canvas_;
        ui::canvas::CanvasHistory history_;
        ui::canvas::CanvasInteraction interaction_;
        ui::viewport::ViewTransform view_;
        ui::raster::CanvasRenderer renderer_;

        bool open_{false};
        std::string target_;
        double timestamp_{0.0};
        int duration_{5};
        Imath::V2i surface_size_{0, 0};

        // touch session state
        bool gesture_{false};
        size_t gesture_contacts_{0};
        bool mouse_panning_{false};

        bool save_in_flight_{false};
        uint64_t save_id_{0};
        uint64_t revision_{0};
        uint64_t saved_revision_{0};

        // lets save completions outlive the session safely
        std::shared_ptr<DrawingSession *> self_;
    };

} // namespace session
} // namespace scrawl
