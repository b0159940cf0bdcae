// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace scribe::media {

enum class FetchErrc {
    success = 0,
    unsupported_source,
    network_error,
    restricted_content,
    too_large,
    tool_missing,
    not_found,
    download_failed,
    cancelled,
};

namespace detail {

struct FetchErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "scribe::fetch";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<FetchErrc>(ev)) {
            case FetchErrc::success:            return "Success";
            case FetchErrc::unsupported_source: return "Unsupported source";
            case FetchErrc::network_error:      return "Network error while fetching media";
            case FetchErrc::restricted_content: return "Media is private, age-restricted or unavailable";
            case FetchErrc::too_large:          return "Media exceeds the maximum file size";
            case FetchErrc::tool_missing:       return "yt-dlp not found";
            case FetchErrc::not_found:          return "Media file not found";
            case FetchErrc::download_failed:    return "Media download failed";
            case FetchErrc::cancelled:          return "Fetch cancelled";
            default:                            return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::FetchErrcCategory& fetch_errc_category() noexcept {
    static detail::FetchErrcCategory category;
    return category;
}

inline std::error_code make_error_code(FetchErrc e) noexcept {
    return {static_cast<int>(e), fetch_errc_category()};
}

} // namespace scribe::media

namespace std {

template<>
struct is_error_code_enum<scribe::media::FetchErrc> : true_type {};

} // namespace std
