// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/core/config.hpp>
#include <scribe/core/error.hpp>
#include <scribe/version.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace scribe::core {

struct HttpOptions {
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT};
    std::chrono::milliseconds connect_timeout{DEFAULT_CONNECT_TIMEOUT};
    std::string user_agent{USER_AGENT};
    std::string bearer_token;  // Sent as "Authorization: Bearer ..." when set
};

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<std::string> headers;  // "Name: value"
    std::span<const std::byte> body;
};

// How a request follows 3xx responses. Requests with a body keep their
// method and body on 301/302/303 instead of being downgraded to GET.
struct RedirectPolicy {
    bool follow{true};
    bool keep_method{false};
    long max_redirects{static_cast<long>(MAX_REDIRECTS)};
};

[[nodiscard]] RedirectPolicy redirect_policy(std::string_view method) noexcept;

struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // Lowercased names
    std::string body;
    std::string content_type;

    [[nodiscard]] bool ok() const noexcept { return status_code >= 200 && status_code < 300; }
    [[nodiscard]] std::string header(std::string_view lower_name) const;
};

// Thin libcurl wrapper. Every call uses its own easy handle, so one session
// may be shared by concurrent upload workers.
class HttpSession {
public:
    explicit HttpSession(HttpOptions options = {});

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept = default;
    HttpSession& operator=(HttpSession&&) noexcept = default;

    // Transport-level failures (DNS, connect, timeout, abort) come back as
    // errors. Any HTTP status, including 4xx/5xx, is a response.
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    perform(const HttpRequest& request, std::stop_token stoken = {}) const noexcept;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url, std::stop_token stoken = {}) const noexcept;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    post_json(const std::string& url, std::string_view json, std::stop_token stoken = {}) const noexcept;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

} // namespace scribe::core
