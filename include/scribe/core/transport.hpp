// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/core/chunk_store.hpp>
#include <scribe/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace scribe::core {

enum class ErrorClass : std::uint8_t {
    transient,     // Retry with backoff
    permanent,     // Surface immediately
    rate_limited   // Retry, honouring the server's Retry-After
};

[[nodiscard]] std::string_view to_string(ErrorClass kind) noexcept;

struct TransportError {
    ErrorClass kind{ErrorClass::permanent};
    std::error_code code;
    std::int32_t http_status{0};             // 0 when no response was received
    std::chrono::milliseconds retry_after{0};
    std::string detail;

    [[nodiscard]] bool retryable() const noexcept { return kind != ErrorClass::permanent; }
    [[nodiscard]] std::string message() const;

    // Classify a transport-level failure (no HTTP response)
    [[nodiscard]] static TransportError from_code(std::error_code code, std::string detail = {});

    // Classify a non-2xx HTTP status
    [[nodiscard]] static TransportError from_status(std::int32_t status,
                                                    std::chrono::milliseconds retry_after = {},
                                                    std::string detail = {});
};

// Retry-After: delta-seconds or an IMF-fixdate. Zero when absent or unparsable.
[[nodiscard]] std::chrono::milliseconds parse_retry_after(std::string_view value) noexcept;

enum class JobStatus : std::uint8_t {
    queued,
    running,
    succeeded,
    failed,
    cancelled
};

[[nodiscard]] std::string_view to_string(JobStatus status) noexcept;
[[nodiscard]] std::optional<JobStatus> parse_job_status(std::string_view text) noexcept;
[[nodiscard]] constexpr bool is_terminal(JobStatus status) noexcept {
    return status == JobStatus::succeeded || status == JobStatus::failed || status == JobStatus::cancelled;
}

// Upload session announcement sent with init_session
struct FileMeta {
    std::string filename;
    std::uint64_t size{0};
    std::string checksum;
    std::uint64_t chunk_size{0};
    std::uint32_t chunk_count{0};
};

struct ChunkAck {
    std::uint32_t index{0};
};

struct JobStatusReport {
    std::string job_id;
    JobStatus status{JobStatus::queued};
    std::optional<std::string> result_ref;
    std::optional<std::string> error;
    std::optional<double> progress;  // Percent, 0..100
    std::string raw;                 // Response body as received
};

// One remote call per method. Every call returns a value or a classified
// TransportError; implementations must be safe to call from several upload
// workers at once.
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::expected<std::string, TransportError>
    init_session(const FileMeta& meta,
                 const std::optional<std::string>& resume_session_id,
                 std::stop_token stoken = {}) = 0;

    [[nodiscard]] virtual std::expected<ChunkAck, TransportError>
    upload_chunk(std::string_view session_id,
                 const ChunkDescriptor& chunk,
                 std::span<const std::byte> bytes,
                 std::stop_token stoken = {}) = 0;

    [[nodiscard]] virtual std::expected<std::string, TransportError>
    finalize_session(std::string_view session_id,
                     std::string_view checksum,
                     std::stop_token stoken = {}) = 0;

    [[nodiscard]] virtual std::expected<JobStatusReport, TransportError>
    poll_status(std::string_view job_id, std::stop_token stoken = {}) = 0;
};

} // namespace scribe::core
