// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/http_session.hpp>
#include <curl/curl.h>
#include <cctype>
#include <memory>

namespace scribe::core {

namespace {

constexpr std::size_t MAX_RESPONSE_BODY = 16 * 1024 * 1024;

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

bool append_header(HeaderList& list, const std::string& header) noexcept {
    curl_slist* next = curl_slist_append(list.get(), header.c_str());
    if (!next) return false;
    (void)list.release();
    list.reset(next);
    return true;
}

// Header callback: store "name: value" pairs with lowercased names
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    std::size_t total = size * nitems;
    if (!body || body->size() + total > MAX_RESPONSE_BODY) {
        return 0;  // Abort oversized responses
    }
    body->append(ptr, total);
    return total;
}

// Abort the transfer once the caller requests a stop
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* stoken = static_cast<std::stop_token*>(userdata);
    return (stoken && stoken->stop_requested()) ? 1 : 0;
}

std::error_code map_curl_code(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(TransferErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(TransferErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(TransferErrc::refused);
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return make_error_code(TransferErrc::connection_lost);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(TransferErrc::ssl_error);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(TransferErrc::cancelled);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(TransferErrc::invalid_url);
        case CURLE_WRITE_ERROR:
            return make_error_code(TransferErrc::malformed_response);
        default:
            return make_error_code(TransferErrc::network_error);
    }
}

} // namespace

//=============================================================================
// HttpResponse
//=============================================================================

std::string HttpResponse::header(std::string_view lower_name) const {
    auto it = headers.find(std::string(lower_name));
    return it != headers.end() ? it->second : std::string{};
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(HttpOptions options)
    : options_(std::move(options)) {}

std::expected<HttpResponse, std::error_code>
HttpSession::perform(const HttpRequest& request, std::stop_token stoken) const noexcept {
    if (stoken.stop_requested()) {
        return std::unexpected(make_error_code(TransferErrc::cancelled));
    }

    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(TransferErrc::network_error));
        }

        HttpResponse response{};

        HeaderList headers;
        bool headers_ok = true;
        for (const auto& h : request.headers) {
            headers_ok = headers_ok && append_header(headers, h);
        }
        if (!options_.bearer_token.empty()) {
            headers_ok = headers_ok && append_header(headers, "Authorization: Bearer " + options_.bearer_token);
        }
        // Disable "Expect: 100-continue" for chunk bodies
        headers_ok = headers_ok && append_header(headers, "Expect:");
        if (!headers_ok) {
            return std::unexpected(make_error_code(TransferErrc::network_error));
        }

        curl_easy_setopt(curl.ptr, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, options_.user_agent.c_str());

        if (request.method == "GET") {
            curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);
        } else {
            // POSTFIELDS with a custom verb covers POST and PUT with an in-memory body
            curl_easy_setopt(curl.ptr, CURLOPT_POST, 1L);
            curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            curl_easy_setopt(curl.ptr, CURLOPT_POSTFIELDS,
                             request.body.empty() ? "" : reinterpret_cast<const char*>(request.body.data()));
            if (request.method != "POST") {
                curl_easy_setopt(curl.ptr, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            }
        }

        const auto redirects = redirect_policy(request.method);
        curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, redirects.follow ? 1L : 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, redirects.max_redirects);
        if (redirects.keep_method) {
            curl_easy_setopt(curl.ptr, CURLOPT_POSTREDIR, static_cast<long>(CURL_REDIR_POST_ALL));
        }
        curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
        curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &response.body);

        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stoken);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            return std::unexpected(map_curl_code(result));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<std::int32_t>(http_code);

        char* ct = nullptr;
        if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
            response.content_type = ct;
        }

        return response;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
}

RedirectPolicy redirect_policy(std::string_view method) noexcept {
    RedirectPolicy policy;
    policy.keep_method = method != "GET" && method != "HEAD";
    return policy;
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url, std::stop_token stoken) const noexcept {
    HttpRequest request;
    request.method = "GET";
    request.url = url;
    request.headers.emplace_back("Accept: application/json");
    return perform(request, std::move(stoken));
}

std::expected<HttpResponse, std::error_code>
HttpSession::post_json(const std::string& url, std::string_view json, std::stop_token stoken) const noexcept {
    HttpRequest request;
    request.method = "POST";
    request.url = url;
    request.headers.emplace_back("Content-Type: application/json");
    request.headers.emplace_back("Accept: application/json");
    request.body = std::as_bytes(std::span<const char>(json.data(), json.size()));
    return perform(request, std::move(stoken));
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace scribe::core
