// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace scribe::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    // Append an API route to this URL's path: "https://h/api" + "/jobs/1"
    // gives "https://h/api/jobs/1". Query and fragment are dropped.
    [[nodiscard]] std::string join(std::string_view route) const;

    [[nodiscard]] std::uint16_t default_port() const noexcept;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

// Percent-encode a path segment (session and job ids are opaque server strings)
[[nodiscard]] std::string encode_path_segment(std::string_view segment);

} // namespace scribe::core
