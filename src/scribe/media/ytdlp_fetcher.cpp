// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/media/ytdlp_fetcher.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>

namespace scribe::media {

namespace {

using nlohmann::json;

constexpr int EXIT_COMMAND_NOT_FOUND = 127;

std::string to_lower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool contains_any(const std::string& haystack, std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&](std::string_view n) { return haystack.find(n) != std::string::npos; });
}

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string{};
}

FetchError cancelled() {
    return FetchError{make_error_code(FetchErrc::cancelled), {}};
}

} // namespace

YtDlpFetcher::YtDlpFetcher(const core::ClientConfig& config, std::string executable)
    : download_dir_(config.download_dir)
    , quality_(config.audio_quality)
    , max_file_size_(config.max_file_size)
    , verbose_(config.verbose)
    , executable_(std::move(executable))
    , runner_([](const std::vector<std::string>& argv) { return run_process(argv); }) {}

std::expected<std::string, FetchError> YtDlpFetcher::tool_version() {
    auto run = runner_({executable_, "--version"});
    if (!run) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::tool_missing), run.error().message()});
    }
    if (run->exit_code != 0) {
        auto error = classify_failure(*run);
        error.code = make_error_code(FetchErrc::tool_missing);
        return std::unexpected(std::move(error));
    }

    auto lines = run->lines();
    auto it = std::find_if(lines.begin(), lines.end(), [](const std::string& l) { return !l.empty(); });
    if (it == lines.end()) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::tool_missing), "no version output"});
    }
    return *it;
}

std::string_view YtDlpFetcher::format_selector(core::AudioQuality quality) noexcept {
    switch (quality) {
        case core::AudioQuality::best: return "bestaudio/best";
        case core::AudioQuality::good: return "bestaudio[abr<=128]/best[abr<=128]";
        case core::AudioQuality::fast: return "worstaudio/worst";
    }
    return "bestaudio/best";
}

std::string YtDlpFetcher::sanitize_filename(std::string_view name) {
    constexpr std::string_view UNSAFE = "<>:\"/\\|?*";

    std::string out(name);
    for (auto& c : out) {
        if (UNSAFE.find(c) != std::string_view::npos) {
            c = '_';
        }
    }
    if (out.size() > MAX_FILENAME_LENGTH) {
        out.resize(MAX_FILENAME_LENGTH);
    }
    return out;
}

FetchError YtDlpFetcher::classify_failure(const ProcessResult& result) {
    // Prefer yt-dlp's own "ERROR:" line as the detail
    std::string detail;
    for (const auto& line : result.lines()) {
        if (line.find("ERROR:") != std::string::npos) {
            detail = line;
        } else if (detail.empty() && !line.empty()) {
            detail = line;
        }
    }

    if (result.exit_code == EXIT_COMMAND_NOT_FOUND) {
        return FetchError{make_error_code(FetchErrc::tool_missing), detail};
    }

    const auto text = to_lower(result.output);
    if (contains_any(text, {"unsupported url", "no suitable extractor"})) {
        return FetchError{make_error_code(FetchErrc::unsupported_source), detail};
    }
    if (contains_any(text, {"private video", "sign in", "members-only", "members only",
                            "age-restricted", "confirm your age", "copyright",
                            "not available in your country", "geo restrict",
                            "video unavailable", "has been removed"})) {
        return FetchError{make_error_code(FetchErrc::restricted_content), detail};
    }
    if (contains_any(text, {"http error", "timed out", "connection", "unable to download",
                            "network is unreachable", "temporary failure in name resolution",
                            "failed to resolve"})) {
        return FetchError{make_error_code(FetchErrc::network_error), detail};
    }
    return FetchError{make_error_code(FetchErrc::download_failed), detail};
}

std::expected<MediaInfo, FetchError>
YtDlpFetcher::read_info(std::string_view url, std::uint64_t& approx_size) {
    std::vector<std::string> argv{
        executable_, "--no-playlist", "--dump-single-json", "--skip-download", "--no-warnings",
        "--", std::string(url)};

    auto run = runner_(argv);
    if (!run) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::download_failed), run.error().message()});
    }
    if (run->exit_code != 0) {
        return std::unexpected(classify_failure(*run));
    }

    for (const auto& line : run->lines()) {
        if (line.empty() || line.front() != '{') continue;

        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) continue;

        MediaInfo info;
        info.title = string_field(j, "title");
        info.uploader = string_field(j, "uploader");
        info.format = string_field(j, "ext");
        if (auto it = j.find("duration"); it != j.end() && it->is_number()) {
            info.duration = it->get<double>();
        }

        approx_size = 0;
        for (const char* key : {"filesize_approx", "filesize"}) {
            auto it = j.find(key);
            if (it != j.end() && it->is_number() && it->get<double>() > 0) {
                approx_size = static_cast<std::uint64_t>(it->get<double>());
                break;
            }
        }
        return info;
    }

    return std::unexpected(FetchError{make_error_code(FetchErrc::download_failed), "no media info in yt-dlp output"});
}

std::expected<FetchResult, FetchError>
YtDlpFetcher::fetch(std::string_view source, std::stop_token stoken) {
    if (stoken.stop_requested()) {
        return std::unexpected(cancelled());
    }

    std::uint64_t approx_size = 0;
    auto info = read_info(source, approx_size);
    if (!info) {
        return std::unexpected(info.error());
    }
    info->source_url = std::string(source);

    spdlog::info("Title: {}", info->title.empty() ? "(unknown)" : info->title);
    if (!info->uploader.empty()) {
        spdlog::info("Uploader: {}", info->uploader);
    }
    if (info->duration) {
        spdlog::info("Duration: {:.0f}s", *info->duration);
    }

    if (approx_size > max_file_size_) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::too_large),
            "about " + std::to_string(approx_size) + " > " + std::to_string(max_file_size_) + " bytes"});
    }

    if (stoken.stop_requested()) {
        return std::unexpected(cancelled());
    }

    std::error_code ec;
    std::filesystem::path dir(download_dir_);
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::download_failed),
            "cannot create " + download_dir_ + ": " + ec.message()});
    }

    const auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string stem = sanitize_filename(info->title.empty() ? "media" : info->title)
                           + "_" + std::to_string(timestamp);

    std::vector<std::string> argv{
        executable_, "--no-playlist", "--no-progress",
        "-f", std::string(format_selector(quality_)),
        "-x", "--audio-format", "mp3",
        "--audio-quality", quality_ == core::AudioQuality::best ? "0" : "5",
        "-o", (dir / (stem + ".%(ext)s")).string(),
        "--print", "after_move:filepath"};
    if (!verbose_) {
        argv.emplace_back("--no-warnings");
    }
    argv.emplace_back("--");
    argv.emplace_back(source);

    spdlog::info("Downloading audio ({})", core::to_string(quality_));
    auto run = runner_(argv);
    if (!run) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::download_failed), run.error().message()});
    }
    if (run->exit_code != 0) {
        return std::unexpected(classify_failure(*run));
    }

    // yt-dlp prints the final path; fall back to scanning for our stem
    std::filesystem::path downloaded;
    auto lines = run->lines();
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (!it->empty() && std::filesystem::is_regular_file(*it, ec)) {
            downloaded = *it;
            break;
        }
    }
    if (downloaded.empty()) {
        try {
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (entry.is_regular_file() && entry.path().filename().string().starts_with(stem)) {
                    downloaded = entry.path();
                    break;
                }
            }
        } catch (const std::filesystem::filesystem_error& e) {
            spdlog::warn("Could not scan {}: {}", dir.string(), e.what());
        }
    }
    if (downloaded.empty()) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::download_failed),
            "download finished but no file was found"});
    }

    auto size = std::filesystem::file_size(downloaded, ec);
    if (!ec && size > max_file_size_) {
        std::filesystem::remove(downloaded, ec);
        return std::unexpected(FetchError{make_error_code(FetchErrc::too_large),
            std::to_string(size) + " > " + std::to_string(max_file_size_) + " bytes"});
    }

    auto handle = core::FileHandle::from_path(downloaded.string());
    if (!handle) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::download_failed), handle.error().message()});
    }

    info->format = downloaded.extension().string();
    if (!info->format.empty() && info->format.front() == '.') {
        info->format.erase(0, 1);
    }

    spdlog::info("Downloaded {} ({} bytes)", handle->path, handle->size);

    FetchResult result;
    result.file = std::move(*handle);
    result.info = std::move(*info);
    result.owned = true;
    return result;
}

} // namespace scribe::media
