// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/job_tracker.hpp>
#include <scribe/core/backoff.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace scribe::core {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

// start + max_wait, saturating at time_point::max()
Clock::time_point deadline_after(Clock::time_point start, std::chrono::milliseconds max_wait) noexcept {
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - start);
    if (max_wait >= headroom) {
        return Clock::time_point::max();
    }
    return start + std::max(max_wait, std::chrono::milliseconds::zero());
}

} // namespace

std::string_view to_string(TrackErrorKind kind) noexcept {
    switch (kind) {
        case TrackErrorKind::timeout:          return "timeout";
        case TrackErrorKind::remote_failure:   return "remote failure";
        case TrackErrorKind::remote_cancelled: return "remote cancelled";
        case TrackErrorKind::client_cancelled: return "cancelled";
        case TrackErrorKind::transport:        return "transport";
    }
    return "unknown";
}

std::string TrackError::message() const {
    std::string out = "job " + job_id + ": ";
    out += code ? code.message() : std::string(to_string(kind));
    if (http_status != 0) {
        out += " [HTTP " + std::to_string(http_status) + "]";
    }
    if (kind == TrackErrorKind::timeout) {
        out += " after " + std::to_string(elapsed.count() / 1000) + "s";
    }
    if (!detail.empty()) {
        out += ": " + detail;
    }
    return out;
}

//=============================================================================
// JobTracker
//=============================================================================

std::expected<TranscriptionJob, TrackError>
JobTracker::await(std::string_view job_id,
                  std::chrono::milliseconds poll_interval,
                  std::chrono::milliseconds max_wait,
                  std::stop_token stoken) {
    const auto start = Clock::now();
    const auto deadline = deadline_after(start, max_wait);
    const Backoff backoff(poll_interval, std::max(max_interval_, poll_interval));

    std::optional<TranscriptionJob> last;
    std::uint32_t polls = 0;
    std::uint32_t consecutive_errors = 0;

    auto make_error = [&](TrackErrorKind kind, std::error_code code, std::string detail) {
        TrackError error;
        error.kind = kind;
        error.code = code;
        error.job_id = std::string(job_id);
        error.last = last;
        error.detail = std::move(detail);
        error.elapsed = since(start);
        return std::unexpected(std::move(error));
    };

    spdlog::info("Waiting for job {} (poll every {} ms, give up after {} s)",
                 job_id, poll_interval.count(), max_wait.count() / 1000);

    // Polls run on a token that fires on the caller's stop or at the deadline
    std::stop_source poll_stop;
    std::stop_callback forward_stop(stoken, [&poll_stop] { poll_stop.request_stop(); });
    std::jthread watchdog;
    if (deadline != Clock::time_point::max()) {
        watchdog = std::jthread([&poll_stop, deadline](std::stop_token self) {
            if (sleep_until(deadline, self)) {
                poll_stop.request_stop();
            }
        });
    }

    auto timed_out = [&] {
        spdlog::warn("Gave up waiting for job {} after {} polls", job_id, polls);
        return make_error(TrackErrorKind::timeout, make_error_code(TransferErrc::poll_timeout), {});
    };

    while (true) {
        if (stoken.stop_requested()) {
            return make_error(TrackErrorKind::client_cancelled, make_error_code(TransferErrc::cancelled), {});
        }

        auto report = transport_.poll_status(job_id, poll_stop.get_token());
        ++polls;
        auto wait = poll_interval;

        if (report) {
            consecutive_errors = 0;

            TranscriptionJob job;
            job.id = std::string(job_id);
            job.status = report->status;
            job.result_ref = std::move(report->result_ref);
            job.error = std::move(report->error);
            job.progress = report->progress;
            job.raw = std::move(report->raw);
            job.polls = polls;
            job.elapsed = since(start);

            spdlog::debug("Job {} poll {}: {}", job_id, polls, to_string(job.status));
            if (callback_) {
                callback_(job);
            }
            last = job;

            switch (job.status) {
                case JobStatus::succeeded:
                    spdlog::info("Job {} succeeded after {} polls", job_id, polls);
                    return job;
                case JobStatus::failed:
                    return make_error(TrackErrorKind::remote_failure, make_error_code(TransferErrc::job_failed),
                                      job.error.value_or(std::string{}));
                case JobStatus::cancelled:
                    return make_error(TrackErrorKind::remote_cancelled, make_error_code(TransferErrc::job_cancelled),
                                      job.error.value_or(std::string{}));
                case JobStatus::queued:
                case JobStatus::running:
                    break;
            }
        } else {
            const auto& error = report.error();
            if (error.code == TransferErrc::cancelled) {
                if (stoken.stop_requested() || Clock::now() < deadline) {
                    return make_error(TrackErrorKind::client_cancelled, error.code, {});
                }
                return timed_out();
            }
            if (!error.retryable()) {
                spdlog::error("Polling job {} failed: {}", job_id, error.message());
                auto out = make_error(TrackErrorKind::transport, error.code, error.detail);
                out.error().error_class = error.kind;
                out.error().http_status = error.http_status;
                return out;
            }

            ++consecutive_errors;
            wait = backoff.delay(consecutive_errors + 1, error.retry_after);
            spdlog::warn("Polling job {} failed ({} in a row): {}; next poll in {} ms",
                         job_id, consecutive_errors, error.message(), wait.count());
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            return timed_out();
        }

        const auto next = (deadline - now > wait) ? now + wait : deadline;
        if (!sleep_until(next, stoken)) {
            return make_error(TrackErrorKind::client_cancelled, make_error_code(TransferErrc::cancelled), {});
        }
        if (next == deadline) {
            return timed_out();
        }
    }
}

} // namespace scribe::core
