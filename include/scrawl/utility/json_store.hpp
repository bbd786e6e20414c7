// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace scrawl {
namespace utility {

    /* Class JsonStore
    Thin wrapper on nlohmann::json adding access by json pointer path
    ("/session/zoom/max"). Used for preferences and for draft payloads. */
    class JsonStore : public nlohmann::json {
      public:
        using nlohmann::json::get;

        JsonStore(nlohmann::json json = nlohmann::json::object());
        ~JsonStore() = default;

        // throws nlohmann::json::out_of_range if path is missing
        [[nodiscard]] nlohmann::json get(const std::string &path) const;

        template <typename T> [[nodiscard]] T get_or(const std::string &path, const T &fallback) const {
            const auto ptr = nlohmann::json::json_pointer(path);
            if (!contains(ptr))
                return fallback;
            return at(ptr).get<T>();
        }

        [[nodiscard]] bool has(const std::string &path) const;

        void set(const nlohmann::json &json, const std::string &path = "");

        // recursively copy the keys of other into this one
        void merge(const nlohmann::json &other);
    };

    JsonStore open_json(const std::string &path);
    void save_json(const nlohmann::json &json, const std::string &path);

} // namespace utility
} // namespace scrawl
