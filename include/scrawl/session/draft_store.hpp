// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace scrawl {
namespace session {

    /* Class DraftStore
    Key/value storage for autosaved drafts. Writes are fire and forget:
    implementations log failures rather than report them. */
    class DraftStore {
      public:
        virtual ~DraftStore() = default;

        virtual void write(const std::string &key, const std::string &payload) = 0;
        [[nodiscard]] virtual std::optional<std::string> read(const std::string &key) const = 0;
        virtual void clear(const std::string &key) = 0;
    };

    typedef std::shared_ptr<DraftStore> DraftStorePtr;

    class MemoryDraftStore : public DraftStore {
      public:
        MemoryDraftStore() = default;

        void write(const std::string &key, const std::string &payload) override;
        [[nodiscard]] std::optional<std::string> read(const std::string &key) const override;
        void clear(const std::string &key) override;

        [[nodiscard]] size_t size() const { return drafts_.size(); }
        [[nodiscard]] size_t write_count() const { return write_count_; }

      private:
        std::map<std::string, std::string> drafts_;
        size_t write_count_{0};
    };

    // One "<key>.json" file per draft in a directory, created on demand
    class FileDraftStore : public DraftStore {
      public:
        explicit FileDraftStore(std::string directory);

        void write(const std::string &key, const std::string &payload) override;
        [[nodiscard]] std::optional<std::string> read(const std::string &key) const override;
        void clear(const std::string &key) override;

        [[nodiscard]] std::string path_for(const std::string &key) const;

      private:
        std::string directory_;
    };

} // namespace session
} // namespace scrawl
