// SPDX-License-Identifier: Apache-2.0

#include <fstream>
#include <stdexcept>

#include <fmt/format.h>

#include "scrawl/utility/json_store.hpp"

using namespace scrawl::utility;

JsonStore::JsonStore(nlohmann::json json) : nlohmann::json(std::move(json)) {}

nlohmann::json JsonStore::get(const std::string &path) const {
    if (path.empty())
        return *this;
    return at(nlohmann::json::json_pointer(path));
}

bool JsonStore::has(const std::string &path) const {
    if (path.empty())
        return true;
    return contains(nlohmann::json::json_pointer(path));
}

void JsonStore::set(const nlohmann::json &json, const std::string &path) {
    if (path.empty()) {
        nlohmann::json::operator=(json);
    } else {
        (*this)[nlohmann::json::json_pointer(path)] = json;
    }
}

void JsonStore::merge(const nlohmann::json &other) {
    if (!other.is_object() || !is_object()) {
        nlohmann::json::operator=(other);
        return;
    }
    merge_patch(other);
}

JsonStore scrawl::utility::open_json(const std::string &path) {

    std::ifstream i(path);
    if (!i.is_open())
        throw std::runtime_error(fmt::format("Failed to open \"{}\"", path));

    return JsonStore(nlohmann::json::parse(i));
}

void scrawl::utility::save_json(const nlohmann::json &json, const std::string &path) {

    std::ofstream o(path, std::ios::trunc);
    if (!o.is_open())
        throw std::runtime_error(fmt::format("Failed to open \"{}\" for writing", path));
    o << json.dump(2);
    if (!o.good())
        throw std::runtime_error(fmt::format("Failed to write \"{}\"", path));
}
