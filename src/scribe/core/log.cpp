// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/log.hpp>
#include <scribe/disk/error.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace scribe::log {

std::error_code init(spdlog::level::level_enum level, std::string_view log_file) noexcept {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        sinks.push_back(console);

        if (!log_file.empty()) {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                std::string(log_file), LOG_FILE_MAX_SIZE, LOG_FILE_MAX_COUNT);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            // The file keeps debug detail regardless of console verbosity
            file->set_level(spdlog::level::debug);
            sinks.push_back(file);
            console->set_level(level);
        }

        auto logger = std::make_shared<spdlog::logger>(std::string(LOGGER_NAME), sinks.begin(), sinks.end());
        logger->set_level(log_file.empty() ? level : std::min(level, spdlog::level::debug));
        logger->flush_on(spdlog::level::warn);

        spdlog::drop(std::string(LOGGER_NAME));
        spdlog::set_default_logger(logger);
        return {};
    } catch (const spdlog::spdlog_ex&) {
        return make_error_code(disk::DiskErrc::write_error);
    } catch (const std::bad_alloc&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

} // namespace scribe::log
