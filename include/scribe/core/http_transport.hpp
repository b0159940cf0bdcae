// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/core/config.hpp>
#include <scribe/core/http_session.hpp>
#include <scribe/core/transport.hpp>
#include <scribe/core/url.hpp>

namespace scribe::core {

// Transport over the service's JSON/HTTP API:
//   POST /sessions                         -> {"sessionId"}
//   PUT  /sessions/{id}/chunks/{index}     -> {"ack":true}
//   POST /sessions/{id}/finalize           -> {"jobId"}
//   GET  /jobs/{id}                        -> {"status", "result"?, "error"?, "progress"?}
class HttpTransport final : public Transport {
public:
    // server_url must already be validated
    HttpTransport(Url server, HttpOptions options);

    [[nodiscard]] static std::expected<HttpTransport, std::error_code>
    create(const ClientConfig& config) noexcept;

    [[nodiscard]] std::expected<std::string, TransportError>
    init_session(const FileMeta& meta,
                 const std::optional<std::string>& resume_session_id,
                 std::stop_token stoken = {}) override;

    [[nodiscard]] std::expected<ChunkAck, TransportError>
    upload_chunk(std::string_view session_id,
                 const ChunkDescriptor& chunk,
                 std::span<const std::byte> bytes,
                 std::stop_token stoken = {}) override;

    [[nodiscard]] std::expected<std::string, TransportError>
    finalize_session(std::string_view session_id,
                     std::string_view checksum,
                     std::stop_token stoken = {}) override;

    [[nodiscard]] std::expected<JobStatusReport, TransportError>
    poll_status(std::string_view job_id, std::stop_token stoken = {}) override;

    // GET /health, then GET /. Any 2xx or 404 means the server is reachable.
    [[nodiscard]] std::expected<std::int32_t, TransportError>
    check_health(std::stop_token stoken = {});

    [[nodiscard]] const Url& server() const noexcept { return server_; }

private:
    Url server_;
    HttpSession session_;
};

// Parse the 2xx response to PUT /sessions/{id}/chunks/{index}. 204 is an
// ack; any other status needs {"ack":true}.
[[nodiscard]] std::expected<ChunkAck, TransportError>
parse_chunk_ack(std::uint32_t index, std::int32_t status, std::string_view body);

// Parse a GET /jobs/{id} body
[[nodiscard]] std::expected<JobStatusReport, TransportError>
parse_job_report(std::string_view job_id, std::string_view body);

} // namespace scribe::core
