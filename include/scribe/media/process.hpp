// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace scribe::media {

struct ProcessResult {
    int exit_code{-1};
    std::string output;  // stdout and stderr, interleaved

    [[nodiscard]] std::vector<std::string> lines() const;
};

// Quote one argument for /bin/sh
[[nodiscard]] std::string shell_quote(std::string_view arg);

// Run argv through the shell with stderr folded into stdout
[[nodiscard]] std::expected<ProcessResult, std::error_code>
run_process(const std::vector<std::string>& argv) noexcept;

} // namespace scribe::media
