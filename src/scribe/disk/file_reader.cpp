// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/disk/file_reader.hpp>
#include <filesystem>
#include <fstream>

namespace scribe::disk {

//=============================================================================
// FileReader
//=============================================================================

std::error_code FileReader::open(std::string_view path) noexcept {
    try {
        std::filesystem::path p(path);
        std::error_code ec;
        if (!std::filesystem::exists(p, ec)) {
            return make_error_code(DiskErrc::file_not_found);
        }
        if (!std::filesystem::is_regular_file(p, ec)) {
            return make_error_code(DiskErrc::invalid_path);
        }
        auto size = std::filesystem::file_size(p, ec);
        if (ec) {
            return make_error_code(DiskErrc::access_denied);
        }

        path_ = p.string();
        size_ = size;
        open_ = true;
        return {};
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::invalid_path);
    }
}

std::expected<std::vector<std::byte>, std::error_code>
FileReader::read(std::uint64_t offset, std::uint64_t size) const noexcept {
    if (!open_) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }

    try {
        std::ifstream file{path_, std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(DiskErrc::access_denied));
        }

        file.seekg(static_cast<std::streamoff>(offset));
        if (!file) {
            return std::unexpected(make_error_code(DiskErrc::short_read));
        }

        std::vector<std::byte> buffer(static_cast<std::size_t>(size));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
        if (static_cast<std::uint64_t>(file.gcount()) != size) {
            return std::unexpected(make_error_code(DiskErrc::short_read));
        }
        return buffer;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    } catch (const std::ios_base::failure&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

} // namespace scribe::disk
