// SPDX-License-Identifier: Apache-2.0

#include <filesystem>
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "scrawl/session/draft_store.hpp"

using namespace scrawl::session;

namespace fs = std::filesystem;

namespace {

// keys come from host target ids, keep them to a safe file name
std::string sanitise(const std::string &key) {
    std::string result;
    result.reserve(key.size());
    for (const char c : key) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.')
            result.push_back(c);
        else
            result += fmt::format("%{:02X}", static_cast<unsigned char>(c));
    }
    return result;
}

} // anonymous namespace

void MemoryDraftStore::write(const std::string &key, const std::string &payload) {
    drafts_[key] = payload;
    write_count_++;
}

std::optional<std::string> MemoryDraftStore::read(const std::string &key) const {
    const auto p = drafts_.find(key);
    if (p == drafts_.end())
        return {};
    return p->second;
}

void MemoryDraftStore::clear(const std::string &key) { drafts_.erase(key); }

FileDraftStore::FileDraftStore(std::string directory) : directory_(std::move(directory)) {}

std::string FileDraftStore::path_for(const std::string &key) const {
    return (fs::path(directory_) / (sanitise(key) + ".json")).string();
}

void FileDraftStore::write(const std::string &key, const std::string &payload) {

    try {
        fs::create_directories(directory_);

        // written beside the target and renamed into place
        const auto path = path_for(key);
        const auto tmp  = path + ".tmp";
        {
            std::ofstream o(tmp, std::ios::trunc);
            if (!o.is_open())
                throw std::runtime_error(fmt::format("Failed to open \"{}\"", tmp));
            o << payload;
            if (!o.good())
                throw std::runtime_error(fmt::format("Failed to write \"{}\"", tmp));
        }
        fs::rename(tmp, path);

    } catch (const std::exception &e) {
        spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
    }
}

std::optional<std::string> FileDraftStore::read(const std::string &key) const {

    std::ifstream i(path_for(key));
    if (!i.is_open())
        return {};

    std::stringstream ss;
    ss << i.rdbuf();
    return ss.str();
}

void FileDraftStore::clear(const std::string &key) {
    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec)
        spdlog::warn("{} {}", __PRETTY_FUNCTION__, ec.message());
}
