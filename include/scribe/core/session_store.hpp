// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace scribe::core {

// What a later run needs to resume an interrupted upload
struct SessionRecord {
    std::string file_path;
    std::uint64_t file_size{0};
    std::string checksum;
    std::uint64_t chunk_size{0};
    std::string session_id;
    std::vector<std::uint32_t> acked;  // Ascending chunk indices

    // Same file, same bytes, same chunk layout
    [[nodiscard]] bool matches(std::string_view path, std::uint64_t size,
                               std::string_view sum, std::uint64_t chunk) const noexcept {
        return file_path == path && file_size == size && checksum == sum && chunk_size == chunk;
    }
};

// Key-value persistence keyed by file path. The upload driver only relies
// on this contract, never on a storage format.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    // std::nullopt when nothing is stored for this file
    [[nodiscard]] virtual std::expected<std::optional<SessionRecord>, std::error_code>
    load(std::string_view file_path) = 0;

    [[nodiscard]] virtual std::error_code save(const SessionRecord& record) = 0;

    [[nodiscard]] virtual std::error_code remove(std::string_view file_path) = 0;
};

// One JSON document per file: "<file>.scribemeta" beside the media file, or
// "<state_dir>/<file name>.scribemeta" when a state directory is configured.
class FileSessionStore final : public SessionStore {
public:
    explicit FileSessionStore(std::string state_dir = {});

    [[nodiscard]] std::string record_path(std::string_view file_path) const;

    [[nodiscard]] std::expected<std::optional<SessionRecord>, std::error_code>
    load(std::string_view file_path) override;

    [[nodiscard]] std::error_code save(const SessionRecord& record) override;

    [[nodiscard]] std::error_code remove(std::string_view file_path) override;

    [[nodiscard]] bool exists(std::string_view file_path) const;

private:
    std::string state_dir_;
    std::mutex mutex_;
};

} // namespace scribe::core
