// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/core/logging.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <array>
#include <memory>
#include <vector>

namespace conduit::core {

namespace {

constexpr std::array<std::string_view, 7> LEVEL_NAMES = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

} // namespace

bool is_valid_log_level(std::string_view level) noexcept {
    for (auto name : LEVEL_NAMES) {
        if (name == level) return true;
    }
    return false;
}

Result<void> init_logging(const LogSettings& settings) {
    if (!is_valid_log_level(settings.level)) {
        return fail(Errc::config_error, "unknown log level '" + settings.level + "'");
    }
    auto level = spdlog::level::from_str(settings.level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (settings.file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*settings.file));
        } catch (const spdlog::spdlog_ex& e) {
            return fail(Errc::config_error, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("conduit", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));
    return {};
}

} // namespace conduit::core
