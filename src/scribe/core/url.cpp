// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace scribe::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }

    auto rest_start = scheme_end + 3;

    auto path_start = std::min(url_str.find('/', rest_start), url_str.length());
    auto query_start = std::min(url_str.find('?', rest_start), url_str.length());
    auto fragment_start = std::min(url_str.find('#', rest_start), url_str.length());

    auto host_end = std::min({path_start, query_start, fragment_start});

    // Skip user:pass@
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);

    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(TransferErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        auto rest = authority.substr(bracket_end + 1);
        if (!rest.empty() && rest.front() == ':') {
            url.port_ = std::string(rest.substr(1));
        }
    } else {
        auto colon = authority.find(':');
        if (colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    if (!std::all_of(url.port_.begin(), url.port_.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    return url;
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string Url::join(std::string_view route) const {
    std::string prefix = path_;
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }

    std::string result = base();
    result += prefix;
    if (route.empty() || route.front() != '/') {
        result += '/';
    }
    result += route;
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    return 0;
}

std::string encode_path_segment(std::string_view segment) {
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(segment.size());
    for (char c : segment) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += HEX[uc >> 4];
            out += HEX[uc & 0x0F];
        }
    }
    return out;
}

} // namespace scribe::core
