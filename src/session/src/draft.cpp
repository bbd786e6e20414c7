// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <ctime>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "scrawl/session/draft.hpp"

using namespace scrawl;
using namespace scrawl::session;
using namespace scrawl::ui::canvas;

void scrawl::session::to_json(nlohmann::json &j, const Draft &d) {
    j = nlohmann::json{
        {"version", Draft::VERSION},
        {"elements", d.elements},
        {"layers", d.layers},
        {"current_layer_id", d.current_layer_id},
        {"duration", d.duration},
        {"timestamp", d.timestamp},
        {"saved_at", d.saved_at}};
}

void scrawl::session::from_json(const nlohmann::json &j, Draft &d) {

    if (j.at("version").get<int>() != Draft::VERSION)
        throw std::runtime_error(
            fmt::format("Unsupported draft version {}", j.at("version").dump()));

    j.at("elements").get_to(d.elements);
    j.at("layers").get_to(d.layers);
    j.at("current_layer_id").get_to(d.current_layer_id);
    j.at("duration").get_to(d.duration);
    d.timestamp = j.value("timestamp", 0.0);
    d.saved_at  = j.value("saved_at", std::string());
}

std::optional<Draft> scrawl::session::parse_draft(const std::string &text) {

    try {
        const auto j = nlohmann::json::parse(text);

        if (j.at("version").get<int>() != Draft::VERSION) {
            spdlog::warn(
                "{} ignoring draft with version {}", __PRETTY_FUNCTION__, j.at("version").dump());
            return {};
        }

        Draft d;
        j.at("layers").get_to(d.layers);
        if (d.layers.empty()) {
            spdlog::warn("{} ignoring draft with no layers", __PRETTY_FUNCTION__);
            return {};
        }

        for (const auto &item : j.at("elements")) {
            try {
                d.elements.push_back(item.get<Element>());
            } catch (const std::exception &e) {
                spdlog::warn("{} skipping element: {}", __PRETTY_FUNCTION__, e.what());
            }
        }

        d.current_layer_id = j.value("current_layer_id", d.layers.front().id);
        d.duration         = j.value("duration", d.duration);
        d.timestamp        = j.value("timestamp", 0.0);
        d.saved_at         = j.value("saved_at", std::string());
        return d;

    } catch (const std::exception &e) {
        spdlog::warn("{} unreadable draft: {}", __PRETTY_FUNCTION__, e.what());
    }
    return {};
}

std::string scrawl::session::utc_timestamp() {

    const auto now = std::chrono::system_clock::now();
    const auto t   = std::chrono::system_clock::to_time_t(now);
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;

    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return fmt::format("{}.{:03d}Z", buf, ms);
}
