// SPDX-License-Identifier: Apache-2.0

#include <random>
#include <stdexcept>

#include <fmt/format.h>

#include "scrawl/utility/uuid.hpp"

using namespace scrawl::utility;

namespace {

int hex_value(const char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::mt19937_64 &generator() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    return gen;
}

} // anonymous namespace

Uuid::Uuid(const std::string &str) {

    // 8-4-4-4-12
    if (str.size() != 36 || str[8] != '-' || str[13] != '-' || str[18] != '-' ||
        str[23] != '-') {
        throw std::invalid_argument(fmt::format("Malformed uuid \"{}\"", str));
    }

    size_t b = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '-')
            continue;
        const int hi = hex_value(str[i]);
        const int lo = i + 1 < str.size() ? hex_value(str[i + 1]) : -1;
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument(fmt::format("Malformed uuid \"{}\"", str));
        }
        bytes_[b++] = static_cast<uint8_t>((hi << 4) | lo);
        ++i;
    }
}

Uuid Uuid::generate() {

    Uuid result;
    std::uniform_int_distribution<uint64_t> dist;
    const uint64_t a = dist(generator());
    const uint64_t b = dist(generator());
    for (int i = 0; i < 8; ++i) {
        result.bytes_[i]     = static_cast<uint8_t>(a >> (i * 8));
        result.bytes_[i + 8] = static_cast<uint8_t>(b >> (i * 8));
    }
    // version 4, variant 1
    result.bytes_[6] = (result.bytes_[6] & 0x0f) | 0x40;
    result.bytes_[8] = (result.bytes_[8] & 0x3f) | 0x80;
    return result;
}

bool Uuid::is_null() const {
    for (const auto b : bytes_) {
        if (b)
            return false;
    }
    return true;
}

std::string Uuid::to_string() const {

    std::string result;
    result.reserve(36);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            result.push_back('-');
        result += fmt::format("{:02x}", bytes_[i]);
    }
    return result;
}

size_t Uuid::hash() const {
    size_t h = 0;
    for (const auto b : bytes_) {
        h ^= size_t(b) + 0x9e3779b9 + (h << 6) + (h >> 2);
    }
    return h;
}

void scrawl::utility::to_json(nlohmann::json &j, const Uuid &uuid) { j = uuid.to_string(); }

void scrawl::utility::from_json(const nlohmann::json &j, Uuid &uuid) {
    uuid = Uuid(j.get<std::string>());
}
