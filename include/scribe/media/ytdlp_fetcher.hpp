// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/core/config.hpp>
#include <scribe/media/fetcher.hpp>
#include <scribe/media/process.hpp>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace scribe::media {

constexpr std::size_t MAX_FILENAME_LENGTH = 200;

// Downloads the audio track of a hosted video by running yt-dlp.
class YtDlpFetcher final : public Fetcher {
public:
    using Runner = std::function<std::expected<ProcessResult, std::error_code>(const std::vector<std::string>&)>;

    explicit YtDlpFetcher(const core::ClientConfig& config,
                          std::string executable = "yt-dlp");

    // Replace the subprocess runner (tests script yt-dlp output through this)
    void runner(Runner r) { runner_ = std::move(r); }

    [[nodiscard]] std::expected<FetchResult, FetchError>
    fetch(std::string_view source, std::stop_token stoken = {}) override;

    // `yt-dlp --version`; tool_missing when the executable cannot be run
    [[nodiscard]] std::expected<std::string, FetchError> tool_version();

    // yt-dlp -f selector for a quality preset
    [[nodiscard]] static std::string_view format_selector(core::AudioQuality quality) noexcept;

    // Replace <>:"/\|?* with '_' and cap the length
    [[nodiscard]] static std::string sanitize_filename(std::string_view name);

    // Map yt-dlp's exit code and "ERROR:" text to a fetch error
    [[nodiscard]] static FetchError classify_failure(const ProcessResult& result);

private:
    [[nodiscard]] std::expected<MediaInfo, FetchError> read_info(std::string_view url,
                                                                 std::uint64_t& approx_size);

    std::string download_dir_;
    core::AudioQuality quality_;
    std::uint64_t max_file_size_;
    bool verbose_;
    std::string executable_;
    Runner runner_;
};

} // namespace scribe::media
