// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/file_handle.hpp>
#include <scribe/disk/checksum.hpp>
#include <scribe/disk/error.hpp>
#include <filesystem>

namespace scribe::core {

std::string FileHandle::filename() const {
    return std::filesystem::path(path).filename().string();
}

std::expected<FileHandle, std::error_code>
FileHandle::from_path(std::string_view path) noexcept {
    try {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(std::filesystem::path(path), ec);
        if (ec) {
            return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
        }
        if (!std::filesystem::exists(absolute, ec)) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        if (!std::filesystem::is_regular_file(absolute, ec)) {
            return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
        }

        auto size = std::filesystem::file_size(absolute, ec);
        if (ec) {
            return std::unexpected(make_error_code(disk::DiskErrc::access_denied));
        }

        auto checksum = disk::sha256_file(absolute.string());
        if (!checksum) {
            return std::unexpected(checksum.error());
        }

        FileHandle handle;
        handle.path = absolute.lexically_normal().string();
        handle.size = size;
        handle.checksum = std::move(*checksum);
        return handle;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
    }
}

} // namespace scribe::core
