// SPDX-License-Identifier: Apache-2.0

// Replays a JSON drawing script against a DrawingSession and writes the
// flattened result as PNG.
//
//   scrawl_annotate [-v] [-l level] [-o log_file] [-p prefs.json] [-d draft_dir]
//                   script.json out.png
//
// script.json:
//   {
//     "target": "file-7", "timestamp": 12.4, "size": [1280, 720],
//     "commands": [
//       {"op": "tool", "tool": "rectangle"},
//       {"op": "down", "x": 10, "y": 10},
//       {"op": "drag", "x": 110, "y": 60},
//       {"op": "up", "x": 110, "y": 60},
//       {"op": "duration", "value": 8}
//     ]
//   }

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <QGuiApplication>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "scrawl/session/drawing_session.hpp"
#include "scrawl/ui/raster/png_writer.hpp"
#include "scrawl/utility/json_store.hpp"
#include "scrawl/utility/logging.hpp"

using namespace scrawl;
using namespace scrawl::session;
using namespace scrawl::ui;

namespace {

void usage() {
    std::cerr << "usage: scrawl_annotate [-v] [-l level] [-o log_file] [-p prefs.json] "
                 "[-d draft_dir] script.json out.png"
              << std::endl;
}

PointerEvent mouse_event(const EventType type, const nlohmann::json &cmd) {
    return PointerEvent(
        type,
        Signature::Button::Left,
        cmd.value("x", 0.0f),
        cmd.value("y", 0.0f),
        cmd.value("pan", false) ? Signature::PanActionModifier : Signature::NoModifier);
}

PointerEvent touch_event(const EventType type, const nlohmann::json &cmd) {
    std::vector<Imath::V2f> contacts;
    for (const auto &c : cmd.at("contacts"))
        contacts.emplace_back(c.at(0).get<float>(), c.at(1).get<float>());
    return PointerEvent::Touch(type, contacts);
}

utility::Uuid layer_at(const DrawingSession &session, const nlohmann::json &cmd) {
    const auto index = cmd.at("layer").get<size_t>();
    const auto &layers = session.canvas().layers();
    if (index >= layers.size())
        throw std::runtime_error(fmt::format("No layer at index {}", index));
    return layers[index].id;
}

void run_command(DrawingSession &session, const nlohmann::json &cmd) {

    const auto op = cmd.at("op").get<std::string>();

    if (op == "down")
        session.pointer_event(mouse_event(EventType::ButtonDown, cmd));
    else if (op == "drag")
        session.pointer_event(mouse_event(EventType::Drag, cmd));
    else if (op == "up")
        session.pointer_event(mouse_event(EventType::ButtonRelease, cmd));
    else if (op == "touch_down")
        session.pointer_event(touch_event(EventType::ButtonDown, cmd));
    else if (op == "touch_move")
        session.pointer_event(touch_event(EventType::Drag, cmd));
    else if (op == "touch_up")
        session.pointer_event(touch_event(EventType::ButtonRelease, cmd));
    else if (op == "cancel")
        session.pointer_event(PointerEvent(EventType::Cancel));
    else if (op == "tool") {
        const auto tool = canvas::Tool_from_str(cmd.at("tool").get<std::string>());
        if (!tool)
            throw std::runtime_error(fmt::format("Unknown tool {}", cmd.at("tool").dump()));
        session.set_tool(*tool);
    } else if (op == "colour")
        session.set_colour(cmd.at("value").get<utility::ColourTriplet>());
    else if (op == "width")
        session.set_stroke_width(cmd.at("value").get<float>());
    else if (op == "duration")
        session.set_duration(cmd.at("value").get<int>());
    else if (op == "text")
        session.confirm_text(cmd.at("text").get<std::string>());
    else if (op == "cancel_text")
        session.cancel_text();
    else if (op == "undo")
        session.undo();
    else if (op == "redo")
        session.redo();
    else if (op == "clear")
        session.clear();
    else if (op == "layer_create")
        session.create_layer();
    else if (op == "layer_select")
        session.select_layer(layer_at(session, cmd));
    else if (op == "layer_visibility")
        session.toggle_layer_visibility(layer_at(session, cmd));
    else if (op == "layer_lock")
        session.toggle_layer_lock(layer_at(session, cmd));
    else if (op == "layer_rename")
        session.rename_layer(layer_at(session, cmd), cmd.at("name").get<std::string>());
    else if (op == "layer_move")
        session.move_layer(cmd.at("from").get<size_t>(), cmd.at("to").get<size_t>());
    else if (op == "layer_delete")
        session.delete_layer(layer_at(session, cmd));
    else if (op == "layer_merge") {
        std::vector<utility::Uuid> sources;
        for (const auto &index : cmd.at("sources")) {
            nlohmann::json c{{"layer", index}};
            sources.push_back(layer_at(session, c));
        }
        session.merge_layers(layer_at(session, cmd), sources);
    } else
        throw std::runtime_error(fmt::format("Unknown op \"{}\"", op));
}

} // anonymous namespace

int main(int argc, char **argv) {

    std::string prefs_path, draft_dir, log_file;
    std::vector<std::string> positional;
    auto level = spdlog::level::info;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-v") {
            level = spdlog::level::debug;
        } else if (arg == "-l" && i + 1 < argc) {
            level = utility::log_level_from_string(argv[++i]);
        } else if (arg == "-o" && i + 1 < argc) {
            log_file = argv[++i];
        } else if ((arg == "-p" || arg == "-d") && i + 1 < argc) {
            (arg == "-p" ? prefs_path : draft_dir) = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            usage();
            return EXIT_SUCCESS;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        usage();
        return EXIT_FAILURE;
    }

    utility::start_logger(level, log_file);

    // text rendering needs the font database, no display is used
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);

    try {
        SessionConfig config;
        if (!prefs_path.empty())
            config = SessionConfig::from_file(prefs_path);

        DraftStorePtr store;
        if (draft_dir.empty())
            store = std::make_shared<MemoryDraftStore>();
        else
            store = std::make_shared<FileDraftStore>(draft_dir);

        HostCallbacks callbacks;
        callbacks.on_notice = [](const Notice &n) {
            spdlog::info("[{}] {}", NoticeType_to_str(n.type), n.message);
        };

        const auto script = utility::open_json(positional[0]);
        const auto size   = script.get_or("/size", std::vector<int>{1280, 720});
        if (size.size() != 2)
            throw std::runtime_error("size must be [width, height]");

        DrawingSession session(config, store, callbacks);
        if (!session.open(
                script.get_or("/target", std::string("untitled")),
                script.get_or("/timestamp", 0.0),
                Imath::V2i(size[0], size[1])))
            throw std::runtime_error("Failed to open drawing session");

        for (const auto &cmd : script.get_or("/commands", nlohmann::json::array()))
            run_command(session, cmd);

        const auto result = session.flatten();
        raster::write_file(result.png, positional[1]);

        std::cout << nlohmann::json{
                         {"output", positional[1]},
                         {"bytes", result.png.size()},
                         {"timestamp", result.timestamp},
                         {"duration", result.duration},
                         {"elements", session.canvas().size()}}
                         .dump()
                  << std::endl;

    } catch (const std::exception &e) {
        spdlog::critical("{} {}", __PRETTY_FUNCTION__, e.what());
        utility::stop_logger();
        return EXIT_FAILURE;
    }

    utility::stop_logger();
    return EXIT_SUCCESS;
}
