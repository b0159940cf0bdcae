// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/core/config.hpp>
#include <scribe/core/file_handle.hpp>
#include <scribe/media/error.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace scribe::media {

struct MediaInfo {
    std::string title;
    std::string uploader;
    std::optional<double> duration;  // Seconds
    std::string source_url;
    std::string format;              // File extension without the dot
};

struct FetchResult {
    core::FileHandle file;
    MediaInfo info;
    bool owned{false};  // Created by the fetcher, so it may be deleted after upload
};

struct FetchError {
    std::error_code code;
    std::string detail;

    [[nodiscard]] std::string message() const;
};

// Produces a local file (with checksum) from a source reference
class Fetcher {
public:
    virtual ~Fetcher() = default;

    [[nodiscard]] virtual std::expected<FetchResult, FetchError>
    fetch(std::string_view source, std::stop_token stoken = {}) = 0;
};

// Accepts an existing local path or a file:// URL
class LocalFileFetcher final : public Fetcher {
public:
    explicit LocalFileFetcher(std::uint64_t max_file_size = core::DEFAULT_MAX_FILE_SIZE) noexcept
        : max_file_size_(max_file_size) {}

    [[nodiscard]] std::expected<FetchResult, FetchError>
    fetch(std::string_view source, std::stop_token stoken = {}) override;

    [[nodiscard]] static bool accepts(std::string_view source);

private:
    std::uint64_t max_file_size_;
};

// Local paths and file:// go to LocalFileFetcher, http(s) URLs to yt-dlp
[[nodiscard]] std::expected<std::unique_ptr<Fetcher>, FetchError>
make_fetcher(std::string_view source, const core::ClientConfig& config);

} // namespace scribe::media
