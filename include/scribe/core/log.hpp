// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <string_view>
#include <system_error>

namespace scribe::log {

constexpr std::string_view LOGGER_NAME = "scribe";
constexpr std::size_t LOG_FILE_MAX_SIZE = 5 * 1024 * 1024;
constexpr std::size_t LOG_FILE_MAX_COUNT = 3;

// Install the "scribe" logger as spdlog's default: colour console sink on
// stderr plus a rotating file sink when log_file is non-empty.
// Safe to call more than once; the last call wins.
[[nodiscard]] std::error_code init(spdlog::level::level_enum level,
                                   std::string_view log_file = {}) noexcept;

} // namespace scribe::log
