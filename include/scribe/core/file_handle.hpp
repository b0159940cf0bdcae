// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace scribe::core {

// A local media file ready for upload. Immutable once computed; if the bytes
// change afterwards the server rejects the upload at finalize.
struct FileHandle {
    std::string path;       // Absolute
    std::uint64_t size{0};
    std::string checksum;   // SHA-256, lowercase hex

    [[nodiscard]] std::string filename() const;

    [[nodiscard]] static std::expected<FileHandle, std::error_code>
    from_path(std::string_view path) noexcept;
};

} // namespace scribe::core
