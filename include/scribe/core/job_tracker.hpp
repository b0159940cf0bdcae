// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/core/config.hpp>
#include <scribe/core/error.hpp>
#include <scribe/core/transport.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace scribe::core {

struct TranscriptionJob {
    std::string id;
    JobStatus status{JobStatus::queued};
    std::optional<std::string> result_ref;
    std::optional<std::string> error;
    std::optional<double> progress;
    std::string raw;                  // Last status body from the server
    std::uint32_t polls{0};
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool terminal() const noexcept { return is_terminal(status); }
};

enum class TrackErrorKind : std::uint8_t {
    timeout,           // max_wait elapsed without a terminal status
    remote_failure,    // Server reported Failed
    remote_cancelled,  // Server reported Cancelled
    client_cancelled,  // Caller requested a stop
    transport          // Permanent transport error
};

[[nodiscard]] std::string_view to_string(TrackErrorKind kind) noexcept;

struct TrackError {
    TrackErrorKind kind{TrackErrorKind::transport};
    std::error_code code;
    std::string job_id;
    std::optional<TranscriptionJob> last;  // Most recent successful poll
    std::optional<ErrorClass> error_class;
    std::int32_t http_status{0};
    std::string detail;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] std::string message() const;
};

using JobCallback = std::function<void(const TranscriptionJob&)>;

// Polls a submitted job until it reaches a terminal state.
class JobTracker {
public:
    explicit JobTracker(Transport& transport) noexcept
        : transport_(transport) {}

    // Ceiling for the wait between polls after consecutive transient errors
    void max_interval(std::chrono::milliseconds interval) noexcept { max_interval_ = interval; }
    [[nodiscard]] std::chrono::milliseconds max_interval() const noexcept { return max_interval_; }

    // Called after every successful poll
    void callback(JobCallback cb) { callback_ = std::move(cb); }

    // Polls every poll_interval; transient errors double the wait (capped at
    // max_interval) until the next successful poll. Returns the job on
    // Succeeded; an error on Failed, Cancelled, a permanent transport error,
    // max_wait elapsing, or a stop request.
    [[nodiscard]] std::expected<TranscriptionJob, TrackError>
    await(std::string_view job_id,
          std::chrono::milliseconds poll_interval,
          std::chrono::milliseconds max_wait,
          std::stop_token stoken = {});

private:
    Transport& transport_;
    std::chrono::milliseconds max_interval_{DEFAULT_POLL_MAX_INTERVAL};
    JobCallback callback_;
};

} // namespace scribe::core
