// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <memory>

#include "scrawl/session/drawing_session.hpp"
#include "scrawl/ui/canvas/hit_test.hpp"

using namespace scrawl;
using namespace scrawl::session;
using namespace scrawl::ui;
using namespace scrawl::ui::canvas;
using Imath::V2f;

namespace {

struct SaveRequest {
    std::vector<uint8_t> png;
    int timestamp;
    int duration;
    HostCallbacks::SaveCompletion completion;
};

} // anonymous namespace

class DrawingSessionTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config.font_path = "/nonexistent/font.ttf";
        store            = std::make_shared<MemoryDraftStore>();
        session          = make_session();
    }

    std::unique_ptr<DrawingSession> make_session() {
        HostCallbacks cb;
        cb.on_save = [this](
                         const std::vector<uint8_t> &png,
                         int timestamp,
                         int duration,
                         HostCallbacks::SaveCompletion completion) {
            saves.push_back(SaveRequest{png, timestamp, duration, completion});
        };
        cb.on_drawing_mode_change = [this](bool drawing) { mode_changes.push_back(drawing); };
        cb.pause_playback         = [this]() { pauses++; };
        cb.on_notice              = [this](const Notice &n) { notices.push_back(n); };
        cb.confirm_discard        = [this]() { return allow_discard; };
        return std::make_unique<DrawingSession>(config, store, cb);
    }

    void open(const std::string &target = "file-7", const double timestamp = 12.7) {
        ASSERT_TRUE(session->open(target, timestamp, Imath::V2i(200, 100)));
    }

    void mouse(const EventType type, const V2f &p, const int modifiers = Signature::NoModifier) {
        session->pointer_event(PointerEvent(type, Signature::Button::Left, p.x, p.y, modifiers));
    }

    void draw(const Tool tool, const V2f &from, const V2f &to) {
        session->set_tool(tool);
        mouse(EventType::ButtonDown, from);
        mouse(EventType::Drag, (from + to) * 0.5f);
        mouse(EventType::Drag, to);
        mouse(EventType::ButtonRelease, to);
    }

    void touch(const EventType type, const std::vector<V2f> &contacts) {
        session->pointer_event(PointerEvent::Touch(type, contacts));
    }

    size_t count(const NoticeType type) const {
        return std::count_if(notices.begin(), notices.end(), [type](const Notice &n) {
            return n.type == type;
        });
    }

    SessionConfig config;
    std::shared_ptr<MemoryDraftStore> store;
    std::unique_ptr<DrawingSession> session;

    std::vector<SaveRequest> saves;
    std::vector<bool> mode_changes;
    std::vector<Notice> notices;
    int pauses{0};
    bool allow_discard{true};
};

TEST_F(DrawingSessionTest, Open) {
    open();
    EXPECT_TRUE(session->is_open());
    EXPECT_EQ(session->target(), "file-7");
    EXPECT_EQ(pauses, 1);
    EXPECT_EQ(mode_changes, std::vector<bool>{true});
    EXPECT_TRUE(notices.empty());
    EXPECT_EQ(session->duration(), 5);

    EXPECT_FALSE(session->open("file-8", 0.0, Imath::V2i(200, 100)));
    EXPECT_EQ(session->target(), "file-7");
}

TEST_F(DrawingSessionTest, OpenNeedsASurface) {
    EXPECT_FALSE(session->open("file-7", 0.0, Imath::V2i(0, 100)));
    EXPECT_FALSE(session->is_open());
    EXPECT_EQ(pauses, 0);
}

TEST_F(DrawingSessionTest, InputIgnoredWhenClosed) {
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));
    EXPECT_TRUE(session->canvas().empty());
}

TEST_F(DrawingSessionTest, DrawRectangle) {
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));

    ASSERT_EQ(session->canvas().size(), 1u);
    const auto hit = hit_test(V2f(60, 35), session->canvas(), config.hit_settings());
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->kind(), ElementKind::Rectangle);
    EXPECT_EQ(hit_test(V2f(500, 500), session->canvas(), config.hit_settings()), nullptr);

    EXPECT_EQ(session->history().size(), 2u);
    EXPECT_TRUE(session->has_unsaved_changes());

    const auto draft = parse_draft(*store->read("drawing-draft-file-7"));
    ASSERT_TRUE(draft);
    EXPECT_EQ(draft->elements.size(), 1u);
}

TEST_F(DrawingSessionTest, ToolSettingsApplyToNewElements) {
    open();
    EXPECT_TRUE(session->set_colour(utility::ColourTriplet(0.0f, 0.0f, 1.0f)));
    EXPECT_TRUE(session->set_stroke_width(8.0f));
    draw(Tool::Arrow, V2f(10, 10), V2f(100, 10));

    const auto &e = session->canvas().elements().at(0);
    EXPECT_EQ(e.colour().to_hex(), "#0000FF");
    EXPECT_FLOAT_EQ(e.stroke_width(), 8.0f);

    EXPECT_FALSE(session->set_stroke_width(0.0f));
    EXPECT_FALSE(session->set_stroke_width(std::numeric_limits<float>::quiet_NaN()));
    EXPECT_FALSE(session->set_colour(utility::ColourTriplet(2.0f, 0.0f, 0.0f)));
    EXPECT_EQ(count(NoticeType::UserInputRejected), 3u);
}

TEST_F(DrawingSessionTest, LockedLayer) {
    open();
    session->toggle_layer_lock(session->canvas().current_layer_id());
    draw(Tool::Freehand, V2f(10, 10), V2f(50, 50));

    EXPECT_TRUE(session->canvas().empty());
    EXPECT_FALSE(session->interaction().working_element());
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].type, NoticeType::UserInputRejected);
    EXPECT_EQ(session->history().size(), 1u);
}

TEST_F(DrawingSessionTest, UndoRedo) {
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));
    draw(Tool::Ellipse, V2f(20, 20), V2f(80, 90));
    const auto both = session->canvas().elements();

    EXPECT_TRUE(session->undo());
    EXPECT_EQ(session->canvas().size(), 1u);
    EXPECT_TRUE(session->redo());
    EXPECT_TRUE(session->canvas().elements() == both);

    EXPECT_TRUE(session->undo());
    EXPECT_TRUE(session->undo());
    EXPECT_TRUE(session->canvas().empty());
    EXPECT_TRUE(notices.empty());

    EXPECT_FALSE(session->undo());
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].type, NoticeType::HistoryBoundary);
    EXPECT_EQ(notices[0].message, "Nothing to undo");

    // a new edit drops the redo branch
    draw(Tool::Arrow, V2f(0, 0), V2f(50, 0));
    EXPECT_FALSE(session->redo());
    EXPECT_EQ(notices.back().message, "Nothing to redo");

    // the draft follows undo
    session->undo();
    EXPECT_TRUE(parse_draft(*store->read("drawing-draft-file-7"))->elements.empty());
}

TEST_F(DrawingSessionTest, UndoAfterLayerDeleteRehomesElements) {
    open();
    session->create_layer();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));
    const auto layer = session->canvas().current_layer_id();

    EXPECT_TRUE(session->delete_layer(layer));
    EXPECT_TRUE(session->canvas().empty());

    EXPECT_TRUE(session->undo());
    ASSERT_EQ(session->canvas().size(), 1u);
    EXPECT_EQ(session->canvas().elements()[0].layer_id(), session->canvas().current_layer_id());
}

TEST_F(DrawingSessionTest, Clear) {
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));
    session->clear();
    EXPECT_TRUE(session->canvas().empty());
    EXPECT_FALSE(session->history().can_undo());
    EXPECT_TRUE(parse_draft(*store->read("drawing-draft-file-7"))->elements.empty());
}

TEST_F(DrawingSessionTest, Text) {
    open();
    session->set_tool(Tool::Text);
    mouse(EventType::ButtonDown, V2f(20, 40));
    mouse(EventType::ButtonRelease, V2f(20, 40));
    EXPECT_EQ(session->interaction().state(), CanvasInteraction::State::PendingText);

    EXPECT_FALSE(session->confirm_text(""));
    EXPECT_TRUE(session->confirm_text("Fix this"));
    ASSERT_EQ(session->canvas().size(), 1u);
    EXPECT_EQ(session->canvas().elements()[0].text(), std::string("Fix this"));
    EXPECT_FLOAT_EQ(session->canvas().elements()[0].stroke_width(), 2.0f);
    EXPECT_EQ(session->history().size(), 2u);

    mouse(EventType::ButtonDown, V2f(60, 60));
    session->cancel_text();
    EXPECT_FALSE(session->confirm_text("late"));
    EXPECT_EQ(session->canvas().size(), 1u);

    // switching tool abandons pending text
    mouse(EventType::ButtonDown, V2f(60, 60));
    session->set_tool(Tool::Freehand);
    EXPECT_FALSE(session->interaction().pending_text_position());
}

TEST_F(DrawingSessionTest, DragMovesElement) {
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));
    const auto id = session->canvas().elements()[0].id();

    draw(Tool::Select, V2f(60, 35), V2f(70, 45));
    EXPECT_EQ(session->canvas().element(id)->anchor(), V2f(20, 20));
    EXPECT_EQ(session->history().size(), 3u);

    session->undo();
    EXPECT_EQ(session->canvas().element(id)->anchor(), V2f(10, 10));

    // a click that does not move is not an edit
    session->set_tool(Tool::Select);
    mouse(EventType::ButtonDown, V2f(60, 35));
    mouse(EventType::ButtonRelease, V2f(60, 35));
    EXPECT_EQ(session->interaction().selection(), id);
    EXPECT_EQ(session->history().cursor(), 1u);
}

TEST_F(DrawingSessionTest, CancelEventDropsCapture) {
    open();
    session->set_tool(Tool::Freehand);
    mouse(EventType::ButtonDown, V2f(10, 10));
    mouse(EventType::Drag, V2f(30, 30));
    session->pointer_event(PointerEvent(EventType::Cancel));
    mouse(EventType::ButtonRelease, V2f(30, 30));
    EXPECT_TRUE(session->canvas().empty());
}

TEST_F(DrawingSessionTest, TouchDraws) {
    open();
    session->set_tool(Tool::Freehand);
    touch(EventType::ButtonDown, {V2f(10, 10)});
    touch(EventType::Drag, {V2f(20, 15)});
    touch(EventType::ButtonRelease, {});
    ASSERT_EQ(session->canvas().size(), 1u);
    EXPECT_EQ(session->canvas().elements()[0].points().size(), 2u);
}

TEST_F(DrawingSessionTest, PinchDiscardsCaptureAndZooms) {
    open();
    session->set_tool(Tool::Freehand);
    touch(EventType::ButtonDown, {V2f(100, 50)});
    touch(EventType::Drag, {V2f(110, 55)});
    EXPECT_TRUE(session->interaction().working_element());

    touch(EventType::ButtonDown, {V2f(110, 55), V2f(130, 55)});
    EXPECT_FALSE(session->interaction().working_element());
    EXPECT_TRUE(session->view_transform().pinching());

    touch(EventType::Drag, {V2f(100, 55), V2f(140, 55)});
    EXPECT_FLOAT_EQ(session->view_transform().zoom(), 2.0f);

    touch(EventType::ButtonRelease, {V2f(100, 55)});
    touch(EventType::ButtonRelease, {});
    EXPECT_FALSE(session->view_transform().pinching());
    EXPECT_TRUE(session->canvas().empty());
    EXPECT_EQ(session->history().size(), 1u);

    // drawing again lands in surface coordinates
    draw(Tool::Rectangle, V2f(40, 20), V2f(80, 60));
    ASSERT_EQ(session->canvas().size(), 1u);
    const auto &e = session->canvas().elements()[0];
    const auto &v = session->view_transform();
    EXPECT_NEAR(v.to_device(e.anchor()).x, 40.0f, 1e-3);
    EXPECT_NEAR(v.to_device(e.anchor()).y, 20.0f, 1e-3);
}

TEST_F(DrawingSessionTest, MousePanWhenZoomed) {
    open();
    mouse(EventType::ButtonDown, V2f(10, 10), Signature::PanActionModifier);
    mouse(EventType::Drag, V2f(30, 10), Signature::PanActionModifier);
    mouse(EventType::ButtonRelease, V2f(30, 10), Signature::PanActionModifier);
    // not zoomed, the press draws
    EXPECT_EQ(session->canvas().size(), 1u);

    touch(EventType::ButtonDown, {V2f(90, 50), V2f(110, 50)});
    touch(EventType::Drag, {V2f(80, 50), V2f(120, 50)});
    touch(EventType::ButtonRelease, {});
    ASSERT_TRUE(session->view_transform().is_zoomed());

    const auto pan = session->view_transform().pan();
    mouse(EventType::ButtonDown, V2f(10, 10), Signature::PanActionModifier);
    mouse(EventType::Drag, V2f(30, 15), Signature::PanActionModifier);
    mouse(EventType::ButtonRelease, V2f(30, 15), Signature::PanActionModifier);
    EXPECT_EQ(session->view_transform().pan(), pan + V2f(20, 5));
    EXPECT_EQ(session->canvas().size(), 1u);
}

TEST_F(DrawingSessionTest, MergeLayers) {
    open();
    const auto a = session->canvas().current_layer_id();
    EXPECT_TRUE(session->create_layer());
    const auto b = session->canvas().current_layer_id();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));

    EXPECT_TRUE(session->merge_layers(a, {b}));
    ASSERT_EQ(session->canvas().layers().size(), 1u);
    EXPECT_EQ(session->canvas().layers()[0].id, a);
    EXPECT_EQ(session->canvas().elements()[0].layer_id(), a);
    EXPECT_EQ(session->history().size(), 3u);

    EXPECT_FALSE(session->merge_layers(a, {a}));
    EXPECT_EQ(count(NoticeType::UserInputRejected), 1u);
}

TEST_F(DrawingSessionTest, LayerRejections) {
    open();
    const auto id = session->canvas().current_layer_id();
    EXPECT_FALSE(session->delete_layer(id));
    EXPECT_FALSE(session->rename_layer(id, "   "));
    EXPECT_FALSE(session->move_layer(0, 4));
    EXPECT_FALSE(session->select_layer(utility::Uuid::generate()));
    EXPECT_EQ(count(NoticeType::UserInputRejected), 4u);
    EXPECT_EQ(session->canvas().layers()[0].name, "Layer 1");
}

TEST_F(DrawingSessionTest, LayerChangesWriteDraft) {
    open();
    const auto writes = store->write_count();
    const auto id     = session->canvas().current_layer_id();

    EXPECT_TRUE(session->rename_layer(id, "Background"));
    EXPECT_TRUE(session->toggle_layer_visibility(id));
    EXPECT_TRUE(session->create_layer());
    EXPECT_TRUE(session->move_layer(1, 0));
    EXPECT_EQ(store->write_count(), writes + 4);

    // no elements changed, nothing to undo
    EXPECT_EQ(session->history().size(), 1u);

    const auto draft = parse_draft(*store->read("drawing-draft-file-7"));
    ASSERT_TRUE(draft);
    EXPECT_EQ(draft->layers.size(), 2u);
    EXPECT_EQ(draft->layers[1].name, "Background");
    EXPECT_FALSE(draft->layers[1].visible);
}

TEST_F(DrawingSessionTest, DraftRestore) {
    open();
    session->set_duration(8);
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));
    draw(Tool::Ellipse, V2f(20, 20), V2f(80, 90));
    draw(Tool::Arrow, V2f(0, 0), V2f(50, 50));
    const auto elements = session->canvas().elements();

    // discarding keeps the draft
    EXPECT_TRUE(session->close());
    EXPECT_FALSE(session->is_open());
    EXPECT_TRUE(store->read("drawing-draft-file-7"));

    notices.clear();
    session = make_session();
    open();

    EXPECT_TRUE(session->canvas().elements() == elements);
    EXPECT_EQ(session->duration(), 8);
    EXPECT_FALSE(session->history().can_undo());
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].type, NoticeType::DraftRestored);
    EXPECT_EQ(notices[0].message, "Restored 3 elements from draft");
}

TEST_F(DrawingSessionTest, DraftIsPerTarget) {
    open("file-7");
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));
    session->close();

    open("file-8");
    EXPECT_TRUE(session->canvas().empty());
    EXPECT_EQ(count(NoticeType::DraftRestored), 0u);
}

TEST_F(DrawingSessionTest, CorruptDraftIgnored) {
    store->write("drawing-draft-file-7", "{\"version\": 1, \"layers\": [");
    open();
    EXPECT_TRUE(session->canvas().empty());
    EXPECT_TRUE(notices.empty());
}

TEST_F(DrawingSessionTest, DraftRestoreDisabled) {
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));
    session->close();

    config.restore_drafts = false;
    session               = make_session();
    open();
    EXPECT_TRUE(session->canvas().empty());
}

TEST_F(DrawingSessionTest, CloseAsksBeforeDiscarding) {
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));

    allow_discard = false;
    EXPECT_FALSE(session->close());
    EXPECT_TRUE(session->is_open());
    EXPECT_EQ(session->canvas().size(), 1u);

    allow_discard = true;
    EXPECT_TRUE(session->close());
    EXPECT_TRUE(session->canvas().empty());
    EXPECT_EQ(mode_changes, (std::vector<bool>{true, false}));
}

TEST_F(DrawingSessionTest, Duration) {
    open();
    session->set_duration(45);
    EXPECT_EQ(session->duration(), 30);
    session->set_duration(0);
    EXPECT_EQ(session->duration(), 1);
    EXPECT_EQ(parse_draft(*store->read("drawing-draft-file-7"))->duration, 1);
}

TEST_F(DrawingSessionTest, Flatten) {
    open("file-7", 12.7);
    session->set_duration(8);
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));

    const auto result = session->flatten();
    ASSERT_GT(result.png.size(), 8u);
    EXPECT_EQ(result.png[0], 0x89);
    EXPECT_EQ(result.png[1], 'P');
    EXPECT_EQ(result.png[2], 'N');
    EXPECT_EQ(result.png[3], 'G');
    EXPECT_EQ(result.timestamp, 12);
    EXPECT_EQ(result.duration, 8);

    // unaffected by the view
    touch(EventType::ButtonDown, {V2f(90, 50), V2f(110, 50)});
    touch(EventType::Drag, {V2f(70, 50), V2f(130, 50)});
    touch(EventType::ButtonRelease, {});
    ASSERT_TRUE(session->view_transform().is_zoomed());
    EXPECT_EQ(session->flatten().png, result.png);

    // but the live view is
    const auto live = session->render();
    EXPECT_EQ(live.width(), 200);
    EXPECT_FALSE(live == raster::make_surface(200, 100));
}

TEST_F(DrawingSessionTest, NegativeTimestampClamped) {
    open("file-7", -0.5);
    EXPECT_EQ(session->flatten().timestamp, 0);
}

TEST_F(DrawingSessionTest, SaveSucceeds) {
    open("file-7", 12.7);
    session->set_duration(8);
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));

    EXPECT_TRUE(session->save());
    EXPECT_TRUE(session->save_in_progress());
    ASSERT_EQ(saves.size(), 1u);
    EXPECT_EQ(saves[0].timestamp, 12);
    EXPECT_EQ(saves[0].duration, 8);
    EXPECT_EQ(saves[0].png[1], 'P');

    saves[0].completion(true, "");
    EXPECT_FALSE(session->save_in_progress());
    EXPECT_FALSE(session->is_open());
    EXPECT_TRUE(session->canvas().empty());
    EXPECT_FALSE(store->read("drawing-draft-file-7"));
    EXPECT_EQ(mode_changes.back(), false);

    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].type, NoticeType::SaveSucceeded);
    EXPECT_EQ(notices[0].message, "Drawing saved (8s duration)");

    // a second completion is ignored
    saves[0].completion(true, "");
    EXPECT_EQ(notices.size(), 1u);
}

TEST_F(DrawingSessionTest, SaveFailureKeepsState) {
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));

    EXPECT_TRUE(session->save());
    saves[0].completion(false, "disk full");

    EXPECT_FALSE(session->save_in_progress());
    EXPECT_TRUE(session->is_open());
    EXPECT_EQ(session->canvas().size(), 1u);
    EXPECT_TRUE(store->read("drawing-draft-file-7"));
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].type, NoticeType::SaveFailed);
    EXPECT_TRUE(notices[0].retryable);
    EXPECT_EQ(notices[0].message, "Failed to save drawing: disk full");

    // retry
    EXPECT_TRUE(session->save());
    ASSERT_EQ(saves.size(), 2u);
    saves[1].completion(true, "");
    EXPECT_FALSE(session->is_open());
}

TEST_F(DrawingSessionTest, SaveWhileInFlight) {
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));

    EXPECT_TRUE(session->save());
    EXPECT_FALSE(session->save());
    EXPECT_EQ(saves.size(), 1u);
    EXPECT_EQ(count(NoticeType::UserInputRejected), 1u);

    saves[0].completion(true, "");
    EXPECT_FALSE(session->is_open());
}

TEST_F(DrawingSessionTest, SaveWithoutHandler) {
    HostCallbacks cb;
    cb.on_notice = [this](const Notice &n) { notices.push_back(n); };
    session      = std::make_unique<DrawingSession>(config, store, cb);
    open();

    EXPECT_FALSE(session->save());
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].type, NoticeType::SaveFailed);
    EXPECT_TRUE(notices[0].retryable);
    EXPECT_TRUE(session->is_open());
}

TEST_F(DrawingSessionTest, ThrowingSaveHandler) {
    HostCallbacks cb;
    cb.on_save = [](const std::vector<uint8_t> &, int, int, HostCallbacks::SaveCompletion) {
        throw std::runtime_error("upload refused");
    };
    cb.on_notice = [this](const Notice &n) { notices.push_back(n); };
    session      = std::make_unique<DrawingSession>(config, store, cb);
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));

    EXPECT_FALSE(session->save());
    EXPECT_FALSE(session->save_in_progress());
    EXPECT_EQ(count(NoticeType::SaveFailed), 1u);
    EXPECT_EQ(session->canvas().size(), 1u);
}

TEST_F(DrawingSessionTest, CompletionAfterSessionDestroyed) {
    open();
    EXPECT_TRUE(session->save());
    session.reset();
    EXPECT_NO_THROW(saves[0].completion(true, ""));
    EXPECT_TRUE(notices.empty());
}

TEST_F(DrawingSessionTest, EditsAfterSaveSubmissionAreKept) {
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));
    EXPECT_TRUE(session->save());

    // still drawing while the host uploads
    draw(Tool::Ellipse, V2f(20, 20), V2f(80, 90));
    saves[0].completion(true, "");

    EXPECT_FALSE(session->save_in_progress());
    EXPECT_TRUE(session->is_open());
    EXPECT_EQ(session->canvas().size(), 2u);
    EXPECT_EQ(count(NoticeType::SaveSucceeded), 1u);

    const auto draft = store->read("drawing-draft-file-7");
    ASSERT_TRUE(draft);
    EXPECT_EQ(parse_draft(*draft)->elements.size(), 2u);

    // the newer work can be saved in turn
    EXPECT_TRUE(session->save());
    ASSERT_EQ(saves.size(), 2u);
    saves[1].completion(true, "");
    EXPECT_FALSE(session->is_open());
    EXPECT_FALSE(store->read("drawing-draft-file-7"));
}

TEST_F(DrawingSessionTest, UndoAfterSaveSubmissionIsKept) {
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));
    draw(Tool::Ellipse, V2f(20, 20), V2f(80, 90));
    EXPECT_TRUE(session->save());

    EXPECT_TRUE(session->undo());
    saves[0].completion(true, "");

    EXPECT_TRUE(session->is_open());
    EXPECT_EQ(session->canvas().size(), 1u);
    EXPECT_TRUE(store->read("drawing-draft-file-7"));
}

TEST_F(DrawingSessionTest, CloseAbandonsSaveInFlight) {
    open("file-A");
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));
    EXPECT_TRUE(session->save());
    EXPECT_TRUE(session->close());
    EXPECT_FALSE(session->save_in_progress());

    open("file-B");
    draw(Tool::Ellipse, V2f(20, 20), V2f(80, 90));

    // B can be saved without waiting on A
    EXPECT_TRUE(session->save());
    ASSERT_EQ(saves.size(), 2u);
    EXPECT_EQ(count(NoticeType::UserInputRejected), 0u);

    saves[0].completion(true, "");
    EXPECT_TRUE(session->is_open());
    EXPECT_EQ(session->target(), "file-B");
    EXPECT_EQ(session->canvas().size(), 1u);
    EXPECT_TRUE(session->save_in_progress());
    EXPECT_TRUE(store->read("drawing-draft-file-B"));
    EXPECT_EQ(count(NoticeType::SaveSucceeded), 0u);

    saves[1].completion(true, "");
    EXPECT_FALSE(session->is_open());
    EXPECT_FALSE(store->read("drawing-draft-file-B"));
}

TEST_F(DrawingSessionTest, DeclinedCloseKeepsCapture) {
    open();
    draw(Tool::Rectangle, V2f(10, 10), V2f(110, 60));

    session->set_tool(Tool::Freehand);
    mouse(EventType::ButtonDown, V2f(5, 5));
    mouse(EventType::Drag, V2f(30, 30));
    ASSERT_TRUE(session->interaction().working_element());

    allow_discard = false;
    EXPECT_FALSE(session->close());
    ASSERT_TRUE(session->interaction().working_element());

    mouse(EventType::Drag, V2f(50, 30));
    mouse(EventType::ButtonRelease, V2f(50, 30));
    EXPECT_EQ(session->canvas().size(), 2u);
    EXPECT_EQ(session->canvas().elements().back().kind(), ElementKind::Freehand);
}

TEST_F(DrawingSessionTest, UndoRedoManySteps) {
    open();
    const size_t n = 6;
    for (size_t i = 0; i < n; ++i) {
        const float y = 10.0f + float(i) * 12.0f;
        draw(i % 2 ? Tool::Arrow : Tool::Rectangle, V2f(10, y), V2f(150, y + 8));
    }
    ASSERT_EQ(session->canvas().size(), n);
    const auto drawn = session->canvas().elements();

    for (size_t i = 0; i < n; ++i)
        EXPECT_TRUE(session->undo());
    EXPECT_TRUE(session->canvas().empty());
    EXPECT_FALSE(session->undo());

    for (size_t i = 0; i < n; ++i)
        EXPECT_TRUE(session->redo());
    EXPECT_TRUE(session->canvas().elements() == drawn);
    EXPECT_FALSE(session->redo());
}

TEST_F(DrawingSessionTest, LayerOperationsNeverOrphanElements) {
    open();

    const auto check = [this](const std::string &step) {
        const auto &c = session->canvas();
        EXPECT_GE(c.layers().size(), 1u) << step;
        EXPECT_NE(c.layer(c.current_layer_id()), nullptr) << step;
        for (const auto &e : c.elements())
            EXPECT_NE(c.layer(e.layer_id()), nullptr) << step;
    };
    const auto layer_id = [this](const size_t i) { return session->canvas().layers().at(i).id; };

    draw(Tool::Rectangle, V2f(10, 10), V2f(60, 40));
    check("draw on first layer");
    session->create_layer();
    draw(Tool::Ellipse, V2f(20, 20), V2f(80, 90));
    check("draw on second layer");
    session->create_layer();
    draw(Tool::Arrow, V2f(0, 50), V2f(100, 50));
    check("draw on third layer");

    session->move_layer(2, 0);
    check("move");
    session->merge_layers(layer_id(0), {layer_id(1)});
    check("merge");
    session->delete_layer(layer_id(0));
    check("delete merged layer");
    session->undo();
    check("undo delete");
    session->undo();
    check("undo merge");
    session->redo();
    check("redo merge");
    session->create_layer();
    draw(Tool::Highlight, V2f(30, 30), V2f(70, 70));
    check("draw on new layer");

    while (session->canvas().layers().size() > 1)
        session->delete_layer(layer_id(session->canvas().layers().size() - 1));
    check("delete down to one layer");
    EXPECT_FALSE(session->delete_layer(layer_id(0)));
    check("refuse last layer");

    while (session->undo())
        check("undo");
    while (session->redo())
        check("redo");
}
