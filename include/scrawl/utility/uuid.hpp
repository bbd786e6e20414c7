// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace scrawl {
namespace utility {

    /* Class Uuid
    RFC 4122 version 4 identifier. A default constructed Uuid is null. Used
    for element and layer ids, both of which only need to be unique within
    a drawing session and stable across draft save and restore. */
    class Uuid {
      public:
        Uuid() = default;
        explicit Uuid(const std::string &str);
        Uuid(const Uuid &o) = default;
        Uuid &operator=(const Uuid &o) = default;

        static Uuid generate();

        bool operator==(const Uuid &o) const { return bytes_ == o.bytes_; }
        bool operator!=(const Uuid &o) const { return bytes_ != o.bytes_; }
        bool operator<(const Uuid &o) const { return bytes_ < o.bytes_; }

        [[nodiscard]] bool is_null() const;
        [[nodiscard]] std::string to_string() const;
        [[nodiscard]] size_t hash() const;

        friend std::ostream &operator<<(std::ostream &out, const Uuid &u) {
            return out << u.to_string();
        }

      private:
        std::array<uint8_t, 16> bytes_{};
    };

    inline std::string to_string(const Uuid &uuid) { return uuid.to_string(); }

    void to_json(nlohmann::json &j, const Uuid &uuid);
    void from_json(const nlohmann::json &j, Uuid &uuid);

} // namespace utility
} // namespace scrawl

namespace std {
template <> struct hash<scrawl::utility::Uuid> {
    std::size_t operator()(const scrawl::utility::Uuid &uuid) const { return uuid.hash(); }
};
} // namespace std
