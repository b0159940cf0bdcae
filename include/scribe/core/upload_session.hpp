// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/core/backoff.hpp>
#include <scribe/core/chunk_store.hpp>
#include <scribe/core/config.hpp>
#include <scribe/core/error.hpp>
#include <scribe/core/file_handle.hpp>
#include <scribe/core/session_store.hpp>
#include <scribe/core/transport.hpp>
#include <scribe/disk/file_reader.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace scribe::core {

// Upload state machine
enum class SessionState : std::uint8_t {
    building,     // Planning chunks, obtaining a session id
    in_progress,  // Workers uploading chunks
    finalizing,   // Every chunk acked, finalize call outstanding
    completed,    // Server returned a job id
    failed        // Terminal; the persisted record allows a later resume
};

[[nodiscard]] std::string_view to_string(SessionState state) noexcept;

enum class FailureKind : std::uint8_t {
    init,       // Planning or session init
    io,         // Reading the local file
    chunk,      // A chunk exhausted its retries or hit a permanent error
    finalize,   // Finalize rejected or retries exhausted
    cancelled   // Caller requested a stop
};

[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;

struct SessionFailure {
    FailureKind kind{FailureKind::init};
    std::error_code code;
    std::optional<std::uint32_t> chunk_index;
    std::optional<ErrorClass> error_class;
    std::int32_t http_status{0};
    std::uint32_t attempts{0};
    std::string detail;

    [[nodiscard]] std::string message() const;
};

struct UploadProgress {
    SessionState state{SessionState::building};
    std::uint64_t acked_bytes{0};
    std::uint64_t total_bytes{0};
    std::size_t acked_chunks{0};
    std::size_t total_chunks{0};
};

using UploadCallback = std::function<void(const UploadProgress&)>;

// Drives one file to a fully acknowledged, finalized upload.
//
// A bounded pool of worker threads claims chunks under a single mutex; an
// index moves Pending/Failed -> InFlight exactly once per attempt. Finalize
// is issued only after every chunk is acked and every worker is joined.
class UploadSession {
public:
    UploadSession(FileHandle file, ClientConfig config, Transport& transport,
                  SessionStore* store = nullptr);

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    // Runs Building -> InProgress -> Finalizing -> Completed on the calling
    // thread (plus the worker pool) and returns the server job id.
    // A stop request ends the run with FailureKind::cancelled once in-flight
    // chunk calls have returned.
    [[nodiscard]] std::expected<std::string, SessionFailure>
    drive_to_completion(std::stop_token stoken = {});

    void callback(UploadCallback cb) { callback_ = std::move(cb); }

    [[nodiscard]] SessionState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] const FileHandle& file() const noexcept { return file_; }
    [[nodiscard]] std::string session_id() const;
    [[nodiscard]] ChunkPlan plan() const;
    [[nodiscard]] UploadProgress progress() const;

    // Chunks restored as acked from a persisted record
    [[nodiscard]] std::size_t resumed_chunks() const noexcept { return resumed_chunks_; }

private:
    [[nodiscard]] std::expected<void, SessionFailure> build(std::stop_token stoken);
    [[nodiscard]] std::expected<void, SessionFailure> upload_chunks(std::stop_token stoken);
    [[nodiscard]] std::expected<std::string, SessionFailure> finalize(std::stop_token stoken);

    void worker_loop(std::stop_token pool_stop);

    [[nodiscard]] SessionRecord make_record_locked() const;
    void persist_locked();
    [[nodiscard]] UploadProgress progress_locked() const;
    void notify(const UploadProgress& progress);

    [[nodiscard]] std::unexpected<SessionFailure> fail(SessionFailure failure);

    FileHandle file_;
    ClientConfig config_;
    Transport& transport_;
    SessionStore* store_;
    Backoff backoff_;
    disk::FileReader reader_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    ChunkPlan plan_;
    std::vector<std::chrono::steady_clock::time_point> not_before_;
    std::uint64_t changes_{0};
    std::optional<SessionFailure> failure_;
    std::string session_id_;

    std::atomic<SessionState> state_{SessionState::building};
    std::size_t resumed_chunks_{0};

    std::mutex callback_mutex_;
    UploadCallback callback_;
};

} // namespace scribe::core
