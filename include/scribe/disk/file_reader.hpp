// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace scribe::disk {

// Positional reader for chunk payloads. Each read opens its own stream,
// so concurrent reads from upload workers need no locking.
class FileReader {
public:
    FileReader() = default;

    // Verify the file exists and record its size
    [[nodiscard]] std::error_code open(std::string_view path) noexcept;

    // Read exactly `size` bytes at `offset`; short_read if the file shrank
    [[nodiscard]] std::expected<std::vector<std::byte>, std::error_code>
    read(std::uint64_t offset, std::uint64_t size) const noexcept;

    [[nodiscard]] bool is_open() const noexcept { return open_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }

private:
    std::string path_;
    std::uint64_t size_{0};
    bool open_{false};
};

} // namespace scribe::disk
