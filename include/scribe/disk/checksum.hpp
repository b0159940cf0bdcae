// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/disk/error.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace scribe::disk {

constexpr std::size_t DIGEST_BUFFER_SIZE = 1024 * 1024;

// Lowercase hex SHA-256 of a whole file, streamed in DIGEST_BUFFER_SIZE reads
[[nodiscard]] std::expected<std::string, std::error_code>
sha256_file(std::string_view path) noexcept;

[[nodiscard]] std::expected<std::string, std::error_code>
sha256_hex(std::span<const std::byte> data) noexcept;

} // namespace scribe::disk
