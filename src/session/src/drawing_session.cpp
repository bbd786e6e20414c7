// SPDX-License-Identifier: Apache-2.0

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "scrawl/session/drawing_session.hpp"
#include "scrawl/ui/raster/png_writer.hpp"

using namespace scrawl;
using namespace scrawl::session;
using namespace scrawl::ui;
using namespace scrawl::ui::canvas;

DrawingSession::DrawingSession(
    SessionConfig config, DraftStorePtr draft_store, HostCallbacks callbacks)
    : config_(std::move(config)),
      draft_store_(std::move(draft_store)),
      callbacks_(std::move(callbacks)),
      interaction_(config_.hit_settings()),
      view_(config_.min_zoom, config_.max_zoom),
      renderer_(config_.render_settings()),
      duration_(config_.default_duration),
      self_(std::make_shared<DrawingSession *>(this)) {

    config_.validate();

    ToolSettings s;
    s.colour            = config_.default_colour;
    s.stroke_width      = config_.default_stroke_width;
    s.text_stroke_width = config_.text_stroke_width;
    interaction_.set_tool_settings(s);
}

DrawingSession::~DrawingSession() = default;

void DrawingSession::update_config(const SessionConfig &config) {

    config.validate();
    config_ = config;

    interaction_.set_hit_settings(config_.hit_settings());
    auto s              = interaction_.tool_settings();
    s.text_stroke_width = config_.text_stroke_width;
    interaction_.set_tool_settings(s);

    view_.set_zoom_range(config_.min_zoom, config_.max_zoom);
    renderer_.set_settings(config_.render_settings());
    duration_ = config_.clamp_duration(duration_);
}

bool DrawingSession::open(
    const std::string &target, const double timestamp, const Imath::V2i &surface_size) {

    if (open_) {
        spdlog::warn("{} already drawing on {}", __PRETTY_FUNCTION__, target_);
        return false;
    }
    if (surface_size.x <= 0 || surface_size.y <= 0) {
        spdlog::warn(
            "{} invalid surface size {}x{}", __PRETTY_FUNCTION__, surface_size.x, surface_size.y);
        return false;
    }

    target_       = target;
    timestamp_    = timestamp;
    surface_size_ = surface_size;
    open_         = true;
    view_.reset();

    if (callbacks_.pause_playback)
        callbacks_.pause_playback();
    if (callbacks_.on_drawing_mode_change)
        callbacks_.on_drawing_mode_change(true);

    spdlog::info("Drawing on {} at {:.3f}s", target_, timestamp_);

    restore_draft();
    return true;
}

bool DrawingSession::close() {

    if (!open_)
        return true;

    if (has_unsaved_changes() && callbacks_.confirm_discard && !callbacks_.confirm_discard()) {
        spdlog::debug("{} discard declined", __PRETTY_FUNCTION__);
        return false;
    }

    interaction_.cancel(canvas_);
    interaction_.cancel_text();
    reset_state();
    finish_close();
    return true;
}

void DrawingSession::finish_close() {
    open_ = false;
    view_.reset();
    if (callbacks_.on_drawing_mode_change)
        callbacks_.on_drawing_mode_change(false);
    spdlog::info("Drawing on {} closed", target_);
}

void DrawingSession::reset_state() {
    canvas_.reset();
    history_.reset();
    interaction_.reset();
    duration_         = config_.default_duration;
    gesture_          = false;
    gesture_contacts_ = 0;
    mouse_panning_    = false;

    // a pending save completion no longer refers to this state
    if (save_in_flight_)
        spdlog::info("{} abandoning save {}", __PRETTY_FUNCTION__, save_id_);
    save_in_flight_ = false;
    ++save_id_;
    ++revision_;
}

void DrawingSession::resize(const Imath::V2i &surface_size) {
    if (surface_size.x <= 0 || surface_size.y <= 0) {
        spdlog::warn(
            "{} invalid surface size {}x{}", __PRETTY_FUNCTION__, surface_size.x, surface_size.y);
        return;
    }
    surface_size_ = surface_size;
}

void DrawingSession::set_surface_origin(const Imath::V2f &origin) { view_.set_origin(origin); }

void DrawingSession::pointer_event(const PointerEvent &event) {

    if (!open_)
        return;

    if (event.type() == EventType::Cancel) {
        handle_outcome(interaction_.cancel(canvas_));
        view_.end_pinch();
        view_.end_pan();
        gesture_          = false;
        gesture_contacts_ = 0;
        mouse_panning_    = false;
        return;
    }

    if (event.input_type() == Signature::InputType::TouchScreen &&
        (gesture_ || event.is_multi_touch())) {
        handle_gesture(event);
        return;
    }

    handle_pointer(event);
}

void DrawingSession::handle_gesture(const PointerEvent &event) {

    const auto &contacts = event.contacts();

    if (!gesture_) {
        // a second finger turns the touch into a gesture, whatever the first
        // one was doing is dropped
        if (interaction_.busy()) {
            spdlog::debug("{} pinch discards current capture", __PRETTY_FUNCTION__);
            handle_outcome(interaction_.cancel(canvas_));
        }
        gesture_          = true;
        gesture_contacts_ = 0;
    }

    if (contacts.size() != gesture_contacts_) {
        view_.end_pinch();
        view_.end_pan();
        if (contacts.size() >= 2)
            view_.begin_pinch(contacts[0], contacts[1]);
        else if (contacts.size() == 1)
            view_.begin_pan(contacts[0]);
        gesture_contacts_ = contacts.size();
    } else if (event.type() == EventType::Drag || event.type() == EventType::Move) {
        if (contacts.size() >= 2)
            view_.update_pinch(contacts[0], contacts[1]);
        else if (contacts.size() == 1)
            view_.update_pan(contacts[0]);
    }

    if (contacts.empty()) {
        view_.end_pinch();
        view_.end_pan();
        gesture_          = false;
        gesture_contacts_ = 0;
    }
}

void DrawingSession::handle_pointer(const PointerEvent &event) {

    const auto pos = view_.to_surface(event.position());

    try {
        switch (event.type()) {
        case EventType::ButtonDown:
            if (event.has_modifier(Signature::PanActionModifier) && view_.is_zoomed()) {
                view_.begin_pan(event.position());
                mouse_panning_ = true;
                return;
            }
            handle_outcome(interaction_.pointer_down(canvas_, pos));
            break;

        case EventType::Drag:
        case EventType::Move:
            if (mouse_panning_) {
                view_.update_pan(event.position());
                return;
            }
            handle_outcome(interaction_.pointer_move(canvas_, pos));
            break;

        case EventType::ButtonRelease:
            if (mouse_panning_) {
                view_.end_pan();
                mouse_panning_ = false;
                return;
            }
            handle_outcome(interaction_.pointer_up(canvas_, pos));
            break;

        default:
            break;
        }
    } catch (const RejectedEdit &e) {
        spdlog::info("{} {}", __PRETTY_FUNCTION__, e.what());
        notify(NoticeType::UserInputRejected, e.what());
    }
}

void DrawingSession::handle_outcome(const CanvasInteraction::Outcome outcome) {
    if (outcome == CanvasInteraction::Outcome::Committed)
        commit_snapshot();
}

void DrawingSession::set_tool(const Tool tool) {

    if (interaction_.busy())
        handle_outcome(interaction_.cancel(canvas_));
    if (tool != Tool::Text)
        interaction_.cancel_text();
    interaction_.clear_selection();

    auto s = interaction_.tool_settings();
    s.tool = tool;
    interaction_.set_tool_settings(s);
}

bool DrawingSession::set_colour(const utility::ColourTriplet &colour) {

    for (const float c : {colour.red(), colour.green(), colour.blue()}) {
        if (!(c >= 0.0f && c <= 1.0f)) {
            notify(NoticeType::UserInputRejected, "Invalid colour");
            return false;
        }
    }

    auto s   = interaction_.tool_settings();
    s.colour = colour;
    interaction_.set_tool_settings(s);
    return true;
}

bool DrawingSession::set_stroke_width(const float width) {

    if (!std::isfinite(width) || width <= 0.0f) {
        notify(NoticeType::UserInputRejected, fmt::format("Invalid stroke width {}", width));
        return false;
    }

    auto s         = interaction_.tool_settings();
    s.stroke_width = width;
    interaction_.set_tool_settings(s);
    return true;
}

void DrawingSession::set_duration(const int seconds) {
    duration_ = config_.clamp_duration(seconds);
    state_changed();
}

bool DrawingSession::confirm_text(const std::string &text) {

    try {
        const auto outcome = interaction_.confirm_text(canvas_, text);
        handle_outcome(outcome);
        return outcome == CanvasInteraction::Outcome::Committed;

    } catch (const RejectedEdit &e) {
        spdlog::info("{} {}", __PRETTY_FUNCTION__, e.what());
        notify(NoticeType::UserInputRejected, e.what());
    }
    return false;
}

void DrawingSession::cancel_text() { interaction_.cancel_text(); }

bool DrawingSession::undo() {

    if (interaction_.busy())
        handle_outcome(interaction_.cancel(canvas_));

    if (!history_.undo()) {
        notify(NoticeType::HistoryBoundary, "Nothing to undo");
        return false;
    }

    canvas_.set_elements(history_.current());
    interaction_.clear_selection();
    state_changed();
    return true;
}

bool DrawingSession::redo() {

    if (interaction_.busy())
        handle_outcome(interaction_.cancel(canvas_));

    if (!history_.redo()) {
        notify(NoticeType::HistoryBoundary, "Nothing to redo");
        return false;
    }

    canvas_.set_elements(history_.current());
    interaction_.clear_selection();
    state_changed();
    return true;
}

void DrawingSession::clear() {

    if (interaction_.busy())
        handle_outcome(interaction_.cancel(canvas_));

    canvas_.clear_elements();
    history_.reset();
    interaction_.clear_selection();
    state_changed();
}

template <typename F> bool DrawingSession::layer_op(F &&op) {

    if (interaction_.busy())
        handle_outcome(interaction_.cancel(canvas_));

    try {
        // op returns true when elements were changed
        if (op())
            commit_snapshot();
        else
            state_changed();
        return true;

    } catch (const RejectedEdit &e) {
        spdlog::info("{} {}", __PRETTY_FUNCTION__, e.what());
        notify(NoticeType::UserInputRejected, e.what());
    }
    return false;
}

bool DrawingSession::create_layer() {
    return layer_op([this]() {
        canvas_.create_layer();
        return false;
    });
}

bool DrawingSession::select_layer(const utility::Uuid &id) {
    return layer_op([this, &id]() {
        canvas_.select_layer(id);
        return false;
    });
}

bool DrawingSession::toggle_layer_visibility(const utility::Uuid &id) {
    return layer_op([this, &id]() {
        canvas_.toggle_layer_visibility(id);
        interaction_.clear_selection();
        return false;
    });
}

bool DrawingSession::toggle_layer_lock(const utility::Uuid &id) {
    return layer_op([this, &id]() {
        canvas_.toggle_layer_lock(id);
        return false;
    });
}

bool DrawingSession::rename_layer(const utility::Uuid &id, const std::string &name) {
    return layer_op([this, &id, &name]() {
        canvas_.rename_layer(id, name);
        return false;
    });
}

bool DrawingSession::move_layer(const size_t from, const size_t to) {
    return layer_op([this, from, to]() {
        canvas_.move_layer(from, to);
        return false;
    });
}

bool DrawingSession::delete_layer(const utility::Uuid &id) {
    return layer_op([this, &id]() {
        const auto removed = canvas_.delete_layer(id);
        interaction_.clear_selection();
        return removed > 0;
    });
}

bool DrawingSession::merge_layers(
    const utility::Uuid &target, const std::vector<utility::Uuid> &sources) {
    return layer_op([this, &target, &sources]() {
        return canvas_.merge_layers(target, sources) > 0;
    });
}

void DrawingSession::commit_snapshot() {
    history_.commit(canvas_.elements());
    state_changed();
}

Draft DrawingSession::make_draft() const {
    Draft d;
    d.elements         = canvas_.elements();
    d.layers           = canvas_.layers();
    d.current_layer_id = canvas_.current_layer_id();
    d.duration         = duration_;
    d.timestamp        = timestamp_;
    d.saved_at         = utc_timestamp();
    return d;
}

void DrawingSession::state_changed() {
    ++revision_;
    write_draft();
}

void DrawingSession::write_draft() {

    if (!open_ || !draft_store_ || target_.empty())
        return;

    try {
        draft_store_->write(config_.draft_key(target_), nlohmann::json(make_draft()).dump());
    } catch (const std::exception &e) {
        spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
    }
}

void DrawingSession::restore_draft() {

    if (!config_.restore_drafts || !draft_store_ || !canvas_.empty())
        return;

    const auto key = config_.draft_key(target_);

    std::optional<std::string> text;
    try {
        text = draft_store_->read(key);
    } catch (const std::exception &e) {
        spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
        return;
    }
    if (!text)
        return;

    const auto draft = parse_draft(*text);
    if (!draft || draft->elements.empty())
        return;

    try {
        canvas_.restore(draft->layers, draft->elements, draft->current_layer_id);
    } catch (const std::exception &e) {
        spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
        canvas_.reset();
        return;
    }

    if (canvas_.empty()) {
        canvas_.reset();
        return;
    }

    duration_ = config_.clamp_duration(draft->duration);
    history_.reset(canvas_.elements());

    const auto n = canvas_.size();
    spdlog::info("Restored {} elements for {} saved at {}", n, target_, draft->saved_at);
    notify(
        NoticeType::DraftRestored,
        fmt::format("Restored {} element{} from draft", n, n == 1 ? "" : "s"));
}

bool DrawingSession::save() {

    if (!open_) {
        spdlog::warn("{} nothing open", __PRETTY_FUNCTION__);
        return false;
    }
    if (save_in_flight_) {
        notify(NoticeType::UserInputRejected, "A save is already in progress");
        return false;
    }
    if (!callbacks_.on_save) {
        notify(NoticeType::SaveFailed, "Saving is not available", true);
        return false;
    }

    if (interaction_.busy())
        handle_outcome(interaction_.cancel(canvas_));

    FlattenResult result;
    try {
        result = flatten();
    } catch (const std::exception &e) {
        spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
        notify(NoticeType::SaveFailed, fmt::format("Failed to save drawing: {}", e.what()), true);
        return false;
    }

    const auto id       = ++save_id_;
    const auto key      = config_.draft_key(target_);
    const auto duration = result.duration;
    save_in_flight_     = true;
    saved_revision_     = revision_;

    std::weak_ptr<DrawingSession *> weak = self_;

    spdlog::info(
        "Saving drawing on {}: {} bytes at {}s for {}s",
        target_,
        result.png.size(),
        result.timestamp,
        result.duration);

    try {
        callbacks_.on_save(
            result.png,
            result.timestamp,
            result.duration,
            [weak, id, key, duration](bool success, const std::string &error) {
                if (auto self = weak.lock())
                    (*self)->on_save_complete(id, key, duration, success, error);
            });

    } catch (const std::exception &e) {
        spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
        on_save_complete(id, key, duration, false, e.what());
        return false;
    }

    return true;
}

void DrawingSession::on_save_complete(
    const uint64_t id,
    const std::string &draft_key,
    const int duration,
    const bool success,
    const std::string &error) {

    if (!save_in_flight_ || id != save_id_) {
        spdlog::debug("{} ignoring completion of save {}", __PRETTY_FUNCTION__, id);
        return;
    }
    save_in_flight_ = false;

    if (!success) {
        spdlog::warn("{} {}", __PRETTY_FUNCTION__, error);
        notify(
            NoticeType::SaveFailed,
            error.empty() ? std::string("Failed to save drawing")
                          : fmt::format("Failed to save drawing: {}", error),
            true);
        return;
    }

    notify(NoticeType::SaveSucceeded, fmt::format("Drawing saved ({}s duration)", duration));

    // edits made after the save was submitted are not in the saved image
    if (revision_ != saved_revision_) {
        spdlog::info(
            "{} drawing on {} changed since save {}, keeping it open",
            __PRETTY_FUNCTION__,
            target_,
            id);
        return;
    }

    if (draft_store_) {
        try {
            draft_store_->clear(draft_key);
        } catch (const std::exception &e) {
            spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
        }
    }

    reset_state();
    if (open_)
        finish_close();
}

QImage DrawingSession::render() const {

    auto image = raster::make_surface(surface_size_.x, surface_size_.y);
    const auto &working = interaction_.working_element();
    renderer_.render(image, canvas_, view_, working ? &(*working) : nullptr);
    return image;
}

FlattenResult DrawingSession::flatten() const {

    // unzoomed, unpanned, surface origin at the image origin
    const viewport::ViewTransform identity;

    auto image = raster::make_surface(surface_size_.x, surface_size_.y);
    renderer_.render(image, canvas_, identity);

    FlattenResult result;
    result.png       = raster::encode_png(image);
    result.timestamp = std::max(0, int(std::floor(timestamp_)));
    result.duration  = config_.clamp_duration(duration_);
    return result;
}

void DrawingSession::notify(
    const NoticeType type, const std::string &message, const bool retryable) {

    spdlog::debug("{} {} {}", __PRETTY_FUNCTION__, NoticeType_to_str(type), message);

    if (!callbacks_.on_notice)
        return;

    try {
        callbacks_.on_notice(Notice{type, message, retryable});
    } catch (const std::exception &e) {
        spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
    }
}
