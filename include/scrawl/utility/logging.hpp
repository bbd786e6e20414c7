// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace scrawl {
namespace utility {

    // Install the default logger: a colour console sink and, when log_file
    // is set, a rotating file sink next to it.
    void start_logger(
        const spdlog::level::level_enum level = spdlog::level::info,
        const std::string &log_file           = "");

    void stop_logger();

    spdlog::level::level_enum log_level_from_string(const std::string &name);

} // namespace utility
} // namespace scrawl
