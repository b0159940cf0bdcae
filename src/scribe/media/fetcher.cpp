// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/media/fetcher.hpp>
#include <scribe/media/ytdlp_fetcher.hpp>
#include <scribe/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace scribe::media {

namespace {

constexpr std::string_view FILE_SCHEME = "file://";

} // namespace

std::string FetchError::message() const {
    std::string out = code ? code.message() : std::string("Fetch failed");
    if (!detail.empty()) {
        out += ": " + detail;
    }
    return out;
}

//=============================================================================
// LocalFileFetcher
//=============================================================================

bool LocalFileFetcher::accepts(std::string_view source) {
    return source.starts_with(FILE_SCHEME) || source.find("://") == std::string_view::npos;
}

std::expected<FetchResult, FetchError>
LocalFileFetcher::fetch(std::string_view source, std::stop_token stoken) {
    if (stoken.stop_requested()) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::cancelled), {}});
    }

    std::string_view path = source;
    if (path.starts_with(FILE_SCHEME)) {
        path.remove_prefix(FILE_SCHEME.size());
    }
    if (path.empty()) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::unsupported_source), std::string(source)});
    }

    std::error_code ec;
    std::filesystem::path p(path);
    if (!std::filesystem::is_regular_file(p, ec)) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::not_found), std::string(path)});
    }

    auto size = std::filesystem::file_size(p, ec);
    if (!ec && size > max_file_size_) {
        return std::unexpected(FetchError{make_error_code(FetchErrc::too_large),
            std::to_string(size) + " > " + std::to_string(max_file_size_) + " bytes"});
    }

    spdlog::info("Hashing {}", p.string());
    auto handle = core::FileHandle::from_path(p.string());
    if (!handle) {
        auto code = handle.error() == disk::DiskErrc::file_not_found
            ? make_error_code(FetchErrc::not_found)
            : make_error_code(FetchErrc::download_failed);
        return std::unexpected(FetchError{code, handle.error().message()});
    }

    FetchResult result;
    result.info.title = p.stem().string();
    result.info.source_url = std::string(source);
    result.info.format = p.extension().string();
    if (!result.info.format.empty() && result.info.format.front() == '.') {
        result.info.format.erase(0, 1);
    }
    result.file = std::move(*handle);
    result.owned = false;
    return result;
}

//=============================================================================
// Factory
//=============================================================================

std::expected<std::unique_ptr<Fetcher>, FetchError>
make_fetcher(std::string_view source, const core::ClientConfig& config) {
    if (LocalFileFetcher::accepts(source)) {
        return std::make_unique<LocalFileFetcher>(config.max_file_size);
    }
    if (source.starts_with("http://") || source.starts_with("https://")) {
        return std::make_unique<YtDlpFetcher>(config);
    }
    return std::unexpected(FetchError{make_error_code(FetchErrc::unsupported_source), std::string(source)});
}

} // namespace scribe::media
