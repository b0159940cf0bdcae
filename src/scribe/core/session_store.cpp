// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/session_store.hpp>
#include <scribe/core/error.hpp>
#include <scribe/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace scribe::core {

namespace {

using nlohmann::json;

constexpr std::string_view RECORD_EXTENSION = ".scribemeta";
constexpr int RECORD_VERSION = 1;

} // namespace

FileSessionStore::FileSessionStore(std::string state_dir)
    : state_dir_(std::move(state_dir)) {}

std::string FileSessionStore::record_path(std::string_view file_path) const {
    std::filesystem::path p(file_path);
    if (state_dir_.empty()) {
        return std::string(file_path) + std::string(RECORD_EXTENSION);
    }
    return (std::filesystem::path(state_dir_) / (p.filename().string() + std::string(RECORD_EXTENSION))).string();
}

std::expected<std::optional<SessionRecord>, std::error_code>
FileSessionStore::load(std::string_view file_path) {
    std::lock_guard lock(mutex_);

    const auto path = record_path(file_path);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::optional<SessionRecord>{};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::access_denied));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::unexpected(make_error_code(TransferErrc::malformed_response));
    }

    try {
        SessionRecord record;
        record.file_path = j.at("file").get<std::string>();
        record.file_size = j.at("size").get<std::uint64_t>();
        record.checksum = j.at("checksum").get<std::string>();
        record.chunk_size = j.at("chunkSize").get<std::uint64_t>();
        record.session_id = j.at("sessionId").get<std::string>();
        record.acked = j.at("acked").get<std::vector<std::uint32_t>>();
        return std::optional<SessionRecord>{std::move(record)};
    } catch (const json::exception&) {
        return std::unexpected(make_error_code(TransferErrc::malformed_response));
    }
}

std::error_code FileSessionStore::save(const SessionRecord& record) {
    std::lock_guard lock(mutex_);

    try {
        std::filesystem::path p(record_path(record.file_path));
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        json j = {
            {"version", RECORD_VERSION},
            {"file", record.file_path},
            {"size", record.file_size},
            {"checksum", record.checksum},
            {"chunkSize", record.chunk_size},
            {"sessionId", record.session_id},
            {"acked", record.acked},
        };

        // Write beside the record and rename so a crash never leaves half a file
        auto tmp = p;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            file << j.dump();
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, p, ec);
        if (ec) {
            std::filesystem::remove(tmp, ec);
            return make_error_code(disk::DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::error_code FileSessionStore::remove(std::string_view file_path) {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    std::filesystem::remove(record_path(file_path), ec);
    return ec ? make_error_code(disk::DiskErrc::write_error) : std::error_code{};
}

bool FileSessionStore::exists(std::string_view file_path) const {
    std::error_code ec;
    return std::filesystem::exists(record_path(file_path), ec);
}

} // namespace scribe::core
