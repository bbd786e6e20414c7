// SPDX-License-Identifier: Apache-2.0

#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "scrawl/utility/logging.hpp"

using namespace scrawl::utility;

void scrawl::utility::start_logger(
    const spdlog::level::level_enum level, const std::string &log_file) {

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 5, 3));
        } catch (const spdlog::spdlog_ex &e) {
            spdlog::warn("{} {}", __PRETTY_FUNCTION__, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("scrawl", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

void scrawl::utility::stop_logger() {
    if (auto logger = spdlog::default_logger())
        logger->flush();
    spdlog::shutdown();
}

spdlog::level::level_enum scrawl::utility::log_level_from_string(const std::string &name) {
    return spdlog::level::from_str(name);
}
