// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/http_transport.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace scribe::core {

namespace {

using nlohmann::json;

constexpr std::size_t MAX_DETAIL_LENGTH = 200;

std::string to_lower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Human-readable reason from an error response: the JSON "error", "message"
// or "detail" field when present, else the start of the body.
std::string error_detail(const HttpResponse& response) {
    json j = json::parse(response.body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        for (const char* key : {"error", "message", "detail"}) {
            auto it = j.find(key);
            if (it != j.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
    }

    std::string text = response.body.substr(0, MAX_DETAIL_LENGTH);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    return text;
}

TransportError status_error(const HttpResponse& response) {
    return TransportError::from_status(response.status_code,
                                       parse_retry_after(response.header("retry-after")),
                                       error_detail(response));
}

TransportError malformed(std::string detail, std::int32_t status = 0) {
    auto error = TransportError::from_code(make_error_code(TransferErrc::malformed_response), std::move(detail));
    error.http_status = status;
    return error;
}

// Parse a 2xx JSON body and pull a required non-empty string field
std::expected<std::string, TransportError>
required_string(const HttpResponse& response, const char* key) {
    json j = json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::unexpected(malformed("response is not a JSON object", response.status_code));
    }
    auto it = j.find(key);
    if (it == j.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return std::unexpected(malformed(std::string("missing \"") + key + "\"", response.status_code));
    }
    return it->get<std::string>();
}

} // namespace

//=============================================================================
// HttpTransport
//=============================================================================

HttpTransport::HttpTransport(Url server, HttpOptions options)
    : server_(std::move(server))
    , session_(std::move(options)) {}

std::expected<HttpTransport, std::error_code>
HttpTransport::create(const ClientConfig& config) noexcept {
    try {
        auto url = Url::parse(config.server_url);
        if (!url) {
            return std::unexpected(url.error());
        }

        HttpOptions options;
        options.timeout = config.timeout;
        options.connect_timeout = config.connect_timeout;
        options.bearer_token = config.api_key;
        return HttpTransport(std::move(*url), std::move(options));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }
}

std::expected<std::string, TransportError>
HttpTransport::init_session(const FileMeta& meta,
                            const std::optional<std::string>& resume_session_id,
                            std::stop_token stoken) {
    json body = {
        {"filename", meta.filename},
        {"size", meta.size},
        {"checksum", meta.checksum},
        {"chunkSize", meta.chunk_size},
        {"chunkCount", meta.chunk_count},
    };
    if (resume_session_id) {
        body["resumeSessionId"] = *resume_session_id;
    }

    auto response = session_.post_json(server_.join("/sessions"), body.dump(), std::move(stoken));
    if (!response) {
        return std::unexpected(TransportError::from_code(response.error()));
    }

    if (!response->ok()) {
        auto error = status_error(*response);
        // The server no longer knows the session we offered to resume
        if (resume_session_id &&
            (response->status_code == 404 || response->status_code == 409 || response->status_code == 410)) {
            error.kind = ErrorClass::permanent;
            error.code = make_error_code(TransferErrc::session_rejected);
        }
        return std::unexpected(std::move(error));
    }

    return required_string(*response, "sessionId");
}

std::expected<ChunkAck, TransportError>
HttpTransport::upload_chunk(std::string_view session_id,
                            const ChunkDescriptor& chunk,
                            std::span<const std::byte> bytes,
                            std::stop_token stoken) {
    HttpRequest request;
    request.method = "PUT";
    request.url = server_.join("/sessions/" + encode_path_segment(session_id)
                               + "/chunks/" + std::to_string(chunk.index));
    request.headers.emplace_back("Content-Type: application/octet-stream");
    request.headers.emplace_back("Accept: application/json");
    request.headers.emplace_back("X-Chunk-Offset: " + std::to_string(chunk.offset));
    request.headers.emplace_back("X-Chunk-Length: " + std::to_string(chunk.length));
    request.body = bytes;

    auto response = session_.perform(request, std::move(stoken));
    if (!response) {
        return std::unexpected(TransportError::from_code(response.error()));
    }
    if (!response->ok()) {
        return std::unexpected(status_error(*response));
    }

    return parse_chunk_ack(chunk.index, response->status_code, response->body);
}

std::expected<std::string, TransportError>
HttpTransport::finalize_session(std::string_view session_id,
                                std::string_view checksum,
                                std::stop_token stoken) {
    json body = {{"checksum", std::string(checksum)}};

    auto response = session_.post_json(
        server_.join("/sessions/" + encode_path_segment(session_id) + "/finalize"),
        body.dump(), std::move(stoken));
    if (!response) {
        return std::unexpected(TransportError::from_code(response.error()));
    }

    if (!response->ok()) {
        auto error = status_error(*response);
        if (error.kind == ErrorClass::permanent &&
            response->status_code >= 400 && response->status_code < 500 &&
            to_lower(response->body).find("checksum") != std::string::npos) {
            error.code = make_error_code(TransferErrc::checksum_mismatch);
        }
        return std::unexpected(std::move(error));
    }

    return required_string(*response, "jobId");
}

std::expected<JobStatusReport, TransportError>
HttpTransport::poll_status(std::string_view job_id, std::stop_token stoken) {
    auto response = session_.get(server_.join("/jobs/" + encode_path_segment(job_id)), std::move(stoken));
    if (!response) {
        return std::unexpected(TransportError::from_code(response.error()));
    }
    if (!response->ok()) {
        return std::unexpected(status_error(*response));
    }
    return parse_job_report(job_id, response->body);
}

std::expected<std::int32_t, TransportError>
HttpTransport::check_health(std::stop_token stoken) {
    TransportError last = TransportError::from_code(make_error_code(TransferErrc::network_error));

    for (const char* route : {"/health", "/"}) {
        auto url = server_.join(route);
        auto response = session_.get(url, stoken);
        if (!response) {
            last = TransportError::from_code(response.error(), url);
            spdlog::debug("Health check {} failed: {}", url, last.message());
            continue;
        }
        if (response->ok() || response->status_code == 404) {
            spdlog::debug("Health check {} -> HTTP {}", url, response->status_code);
            return response->status_code;
        }
        last = status_error(*response);
    }
    return std::unexpected(std::move(last));
}

//=============================================================================
// Job report parsing
//=============================================================================

std::expected<JobStatusReport, TransportError>
parse_job_report(std::string_view job_id, std::string_view body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::unexpected(malformed("job status is not a JSON object"));
    }

    auto status_it = j.find("status");
    if (status_it == j.end() || !status_it->is_string()) {
        return std::unexpected(malformed("missing \"status\""));
    }
    auto status = parse_job_status(status_it->get_ref<const std::string&>());
    if (!status) {
        return std::unexpected(malformed("unknown job status \"" + status_it->get<std::string>() + "\""));
    }

    JobStatusReport report;
    report.job_id = std::string(job_id);
    report.status = *status;
    report.raw = std::string(body);

    if (auto it = j.find("result"); it != j.end() && !it->is_null()) {
        report.result_ref = it->is_string() ? it->get<std::string>() : it->dump();
    }
    if (auto it = j.find("error"); it != j.end() && !it->is_null()) {
        report.error = it->is_string() ? it->get<std::string>() : it->dump();
    }
    if (auto it = j.find("progress"); it != j.end() && it->is_number()) {
        report.progress = std::clamp(it->get<double>(), 0.0, 100.0);
    }

    return report;
}

//=============================================================================
// Chunk ack parsing
//=============================================================================

std::expected<ChunkAck, TransportError>
parse_chunk_ack(std::uint32_t index, std::int32_t status, std::string_view body) {
    // 204 is the only success allowed to omit the body
    if (status == 204) {
        return ChunkAck{index};
    }
    if (body.empty()) {
        return std::unexpected(malformed("empty chunk response", status));
    }

    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::unexpected(malformed("chunk response is not a JSON object", status));
    }
    auto it = j.find("ack");
    if (it == j.end() || !it->is_boolean()) {
        return std::unexpected(malformed("missing \"ack\"", status));
    }
    if (!it->get<bool>()) {
        // Explicit refusal without an error status: worth another attempt
        TransportError error;
        error.kind = ErrorClass::transient;
        error.code = make_error_code(TransferErrc::chunk_failed);
        error.http_status = status;
        error.detail = "server did not acknowledge chunk " + std::to_string(index);
        return std::unexpected(std::move(error));
    }
    return ChunkAck{index};
}

} // namespace scribe::core
