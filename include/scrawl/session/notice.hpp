// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace scrawl {
namespace session {

    enum class NoticeType {
        UserInputRejected,
        HistoryBoundary,
        DraftRestored,
        SaveSucceeded,
        SaveFailed
    };

    constexpr std::string_view NoticeType_to_str(const NoticeType type) {
        switch (type) {
        case NoticeType::UserInputRejected:
            return "UserInputRejected";
        case NoticeType::HistoryBoundary:
            return "HistoryBoundary";
        case NoticeType::DraftRestored:
            return "DraftRestored";
        case NoticeType::SaveSucceeded:
            return "SaveSucceeded";
        case NoticeType::SaveFailed:
            return "SaveFailed";
        }
        return "Undefined";
    }

    // Non blocking message for the user
    struct Notice {
        NoticeType type;
        std::string message;
        // the host should offer to try again
        bool retryable{false};
    };

} // namespace session
} // namespace scrawl
