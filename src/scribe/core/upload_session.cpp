// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/upload_session.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace scribe::core {

namespace {

using Clock = std::chrono::steady_clock;

TransportError cancelled_error() {
    return TransportError::from_code(make_error_code(TransferErrc::cancelled), "stop requested");
}

bool is_cancelled(const TransportError& error) noexcept {
    return error.code == TransferErrc::cancelled;
}

// Repeat a single remote call on transient/rate-limited errors, at most
// max_retries extra times, sleeping interruptibly between attempts.
template<typename Call>
auto call_with_retry(Call&& call, const Backoff& backoff, std::uint32_t max_retries,
                     std::stop_token stoken, std::string_view what, std::uint32_t& attempts)
    -> decltype(call()) {
    for (attempts = 1;; ++attempts) {
        if (stoken.stop_requested()) {
            return std::unexpected(cancelled_error());
        }

        auto result = call();
        if (result || !result.error().retryable() || attempts > max_retries) {
            return result;
        }

        auto wait = backoff.delay(attempts, result.error().retry_after);
        spdlog::warn("{} failed (attempt {}/{}): {}; retrying in {} ms",
                     what, attempts, max_retries + 1, result.error().message(), wait.count());
        if (!sleep_for(wait, stoken)) {
            return std::unexpected(cancelled_error());
        }
    }
}

SessionFailure failure_from(FailureKind kind, const TransportError& error, std::uint32_t attempts) {
    SessionFailure failure;
    failure.kind = is_cancelled(error) ? FailureKind::cancelled : kind;
    failure.code = error.code;
    failure.error_class = error.kind;
    failure.http_status = error.http_status;
    failure.attempts = attempts;
    failure.detail = error.detail;
    return failure;
}

SessionFailure cancelled_failure() {
    SessionFailure failure;
    failure.kind = FailureKind::cancelled;
    failure.code = make_error_code(TransferErrc::cancelled);
    failure.detail = "stop requested";
    return failure;
}

} // namespace

std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::building:    return "building";
        case SessionState::in_progress: return "in_progress";
        case SessionState::finalizing:  return "finalizing";
        case SessionState::completed:   return "completed";
        case SessionState::failed:      return "failed";
    }
    return "unknown";
}

std::string_view to_string(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::init:      return "init";
        case FailureKind::io:        return "io";
        case FailureKind::chunk:     return "chunk";
        case FailureKind::finalize:  return "finalize";
        case FailureKind::cancelled: return "cancelled";
    }
    return "unknown";
}

std::string SessionFailure::message() const {
    std::string out = std::string(to_string(kind)) + " failure";
    if (chunk_index) {
        out += " on chunk " + std::to_string(*chunk_index);
    }
    out += ": ";
    out += code ? code.message() : std::string("unknown error");
    if (http_status != 0) {
        out += " [HTTP " + std::to_string(http_status) + "]";
    }
    if (error_class) {
        out += " (";
        out += to_string(*error_class);
        out += ")";
    }
    if (attempts > 1) {
        out += " after " + std::to_string(attempts) + " attempts";
    }
    if (!detail.empty()) {
        out += ": " + detail;
    }
    return out;
}

//=============================================================================
// UploadSession
//=============================================================================

UploadSession::UploadSession(FileHandle file, ClientConfig config, Transport& transport,
                             SessionStore* store)
    : file_(std::move(file))
    , config_(std::move(config))
    , transport_(transport)
    , store_(store)
    , backoff_(config_.retry_base_delay, config_.retry_max_delay) {
    config_.concurrency = std::clamp(config_.concurrency, MIN_CONCURRENCY, MAX_CONCURRENCY);
}

std::string UploadSession::session_id() const {
    std::lock_guard lock(mutex_);
    return session_id_;
}

ChunkPlan UploadSession::plan() const {
    std::lock_guard lock(mutex_);
    return plan_;
}

UploadProgress UploadSession::progress() const {
    std::lock_guard lock(mutex_);
    return progress_locked();
}

std::expected<std::string, SessionFailure>
UploadSession::drive_to_completion(std::stop_token stoken) {
    if (state() != SessionState::building) {
        SessionFailure failure;
        failure.kind = FailureKind::init;
        failure.code = make_error_code(TransferErrc::invalid_state);
        failure.detail = "session already driven";
        return std::unexpected(std::move(failure));
    }

    spdlog::info("Uploading {} ({} bytes)", file_.path, file_.size);

    if (auto built = build(stoken); !built) {
        return std::unexpected(built.error());
    }
    if (auto uploaded = upload_chunks(stoken); !uploaded) {
        return std::unexpected(uploaded.error());
    }
    return finalize(stoken);
}

//=============================================================================
// Building
//=============================================================================

std::expected<void, SessionFailure> UploadSession::build(std::stop_token stoken) {
    auto plan = ChunkStore::plan(file_, static_cast<std::int64_t>(config_.chunk_size));
    if (!plan) {
        SessionFailure failure;
        failure.kind = FailureKind::init;
        failure.code = plan.error();
        failure.detail = "cannot plan " + std::to_string(file_.size) + " bytes in "
                       + std::to_string(config_.chunk_size) + "-byte chunks";
        return fail(std::move(failure));
    }

    if (auto ec = reader_.open(file_.path)) {
        SessionFailure failure;
        failure.kind = FailureKind::io;
        failure.code = ec;
        failure.detail = file_.path;
        return fail(std::move(failure));
    }

    {
        std::lock_guard lock(mutex_);
        plan_ = std::move(*plan);
        not_before_.assign(plan_.size(), Clock::time_point{});
    }

    FileMeta meta;
    meta.filename = file_.filename();
    meta.size = file_.size;
    meta.checksum = file_.checksum;
    meta.chunk_size = plan_.chunk_size;
    meta.chunk_count = static_cast<std::uint32_t>(plan_.size());

    std::optional<SessionRecord> prior;
    if (store_) {
        auto loaded = store_->load(file_.path);
        if (!loaded) {
            spdlog::warn("Ignoring unreadable session record for {}: {}", file_.path, loaded.error().message());
        } else if (*loaded && (*loaded)->matches(file_.path, file_.size, file_.checksum, plan_.chunk_size)) {
            prior = std::move(**loaded);
        } else if (*loaded) {
            spdlog::info("Session record for {} describes different content; starting fresh", file_.path);
            if (auto ec = store_->remove(file_.path)) {
                spdlog::warn("Could not remove stale session record: {}", ec.message());
            }
        }
    }

    std::string session_id;
    std::uint32_t attempts = 0;

    if (prior) {
        spdlog::info("Offering previous session {} ({} chunks acked)", prior->session_id, prior->acked.size());
        auto resumed = call_with_retry(
            [&] { return transport_.init_session(meta, prior->session_id, stoken); },
            backoff_, config_.max_retries, stoken, "Session init", attempts);

        if (resumed && *resumed == prior->session_id) {
            session_id = *resumed;
            std::lock_guard lock(mutex_);
            for (auto index : prior->acked) {
                if (plan_.contains(index) && !ChunkStore::mark_acked(plan_, index)) {
                    ++resumed_chunks_;
                }
            }
            spdlog::info("Resumed session {}: {} of {} chunks already acked",
                         session_id, resumed_chunks_, plan_.size());
        } else if (resumed) {
            // Server issued a new session: nothing it holds can be trusted
            session_id = *resumed;
            spdlog::info("Server started new session {} instead of {}", session_id, prior->session_id);
        } else if (!is_cancelled(resumed.error()) && !resumed.error().retryable()) {
            spdlog::warn("Previous session {} rejected: {}", prior->session_id, resumed.error().message());
            if (store_) {
                if (auto ec = store_->remove(file_.path)) {
                    spdlog::warn("Could not remove rejected session record: {}", ec.message());
                }
            }
        } else {
            return fail(failure_from(FailureKind::init, resumed.error(), attempts));
        }
    }

    if (session_id.empty()) {
        auto created = call_with_retry(
            [&] { return transport_.init_session(meta, std::nullopt, stoken); },
            backoff_, config_.max_retries, stoken, "Session init", attempts);
        if (!created) {
            return fail(failure_from(FailureKind::init, created.error(), attempts));
        }
        session_id = std::move(*created);
        spdlog::info("Started upload session {} ({} chunks of {} bytes)",
                     session_id, plan_.size(), plan_.chunk_size);
    }

    std::lock_guard lock(mutex_);
    session_id_ = std::move(session_id);
    persist_locked();
    return {};
}

//=============================================================================
// InProgress
//=============================================================================

std::expected<void, SessionFailure> UploadSession::upload_chunks(std::stop_token stoken) {
    state_.store(SessionState::in_progress, std::memory_order_release);

    UploadProgress start;
    {
        std::lock_guard lock(mutex_);
        start = progress_locked();
    }
    notify(start);

    std::stop_source pool_stop;
    {
        // Caller stop ends new dequeues; workers finish their current call
        std::stop_callback forward(stoken, [&pool_stop] { pool_stop.request_stop(); });

        std::size_t workers = std::min<std::size_t>(config_.concurrency, plan_.size());
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            pool.emplace_back([this, token = pool_stop.get_token()] { worker_loop(token); });
        }
        for (auto& worker : pool) {
            worker.join();
        }
    }

    std::unique_lock lock(mutex_);
    if (failure_) {
        auto failure = *failure_;
        lock.unlock();
        return fail(std::move(failure));
    }
    if (!ChunkStore::all_acked(plan_)) {
        lock.unlock();
        spdlog::warn("Upload of {} cancelled", file_.path);
        return fail(cancelled_failure());
    }
    return {};
}

void UploadSession::worker_loop(std::stop_token pool_stop) {
    std::unique_lock lock(mutex_);

    while (!pool_stop.stop_requested() && !failure_) {
        // Lowest index that is retry eligible and past its backoff
        const auto now = Clock::now();
        std::optional<std::uint32_t> next;
        auto earliest = Clock::time_point::max();
        bool remaining = false;

        for (std::uint32_t i = 0; i < plan_.size(); ++i) {
            auto status = plan_.states[i].status;
            if (status == ChunkStatus::acked) continue;
            remaining = true;
            if (status == ChunkStatus::in_flight) continue;
            if (not_before_[i] <= now) {
                next = i;
                break;
            }
            earliest = std::min(earliest, not_before_[i]);
        }

        if (!remaining) {
            return;
        }

        if (!next) {
            const auto seen = changes_;
            auto changed = [&] { return changes_ != seen || failure_.has_value(); };
            if (earliest == Clock::time_point::max()) {
                (void)cv_.wait(lock, pool_stop, changed);
            } else {
                (void)cv_.wait_until(lock, pool_stop, earliest, changed);
            }
            continue;
        }

        const std::uint32_t index = *next;
        if (auto ec = ChunkStore::mark_in_flight(plan_, index)) {
            SessionFailure failure;
            failure.kind = FailureKind::chunk;
            failure.code = ec;
            failure.chunk_index = index;
            failure_ = std::move(failure);
            ++changes_;
            cv_.notify_all();
            return;
        }
        const ChunkDescriptor chunk = plan_.chunks[index];
        const std::uint32_t attempt = plan_.states[index].attempts;
        const std::string session_id = session_id_;
        lock.unlock();

        spdlog::debug("Chunk {} attempt {} ({} bytes at {})", index, attempt, chunk.length, chunk.offset);

        auto bytes = reader_.read(chunk.offset, chunk.length);
        std::expected<ChunkAck, TransportError> result = std::unexpected(TransportError{});
        if (bytes) {
            result = transport_.upload_chunk(session_id, chunk, *bytes);
        }

        lock.lock();
        ++changes_;

        if (!bytes) {
            (void)ChunkStore::mark_failed(plan_, index, bytes.error(), "read failed");
            if (!failure_) {
                SessionFailure failure;
                failure.kind = FailureKind::io;
                failure.code = bytes.error();
                failure.chunk_index = index;
                failure.attempts = attempt;
                failure.detail = file_.path;
                failure_ = std::move(failure);
            }
            cv_.notify_all();
            return;
        }

        if (result) {
            (void)ChunkStore::mark_acked(plan_, index);
            persist_locked();
            auto progress = progress_locked();
            cv_.notify_all();
            lock.unlock();
            notify(progress);
            lock.lock();
            continue;
        }

        const auto& error = result.error();
        (void)ChunkStore::mark_failed(plan_, index, error.code, error.detail);

        if (error.retryable() && attempt <= config_.max_retries) {
            auto wait = backoff_.delay(attempt, error.retry_after);
            not_before_[index] = Clock::now() + wait;
            spdlog::warn("Chunk {} failed (attempt {}/{}): {}; retrying in {} ms",
                         index, attempt, config_.max_retries + 1, error.message(), wait.count());
        } else if (!failure_) {
            spdlog::error("Chunk {} failed permanently after {} attempt(s): {}", index, attempt, error.message());
            auto failure = failure_from(FailureKind::chunk, error, attempt);
            failure.chunk_index = index;
            failure_ = std::move(failure);
        }
        cv_.notify_all();
    }
}

//=============================================================================
// Finalizing
//=============================================================================

std::expected<std::string, SessionFailure> UploadSession::finalize(std::stop_token stoken) {
    if (stoken.stop_requested()) {
        return fail(cancelled_failure());
    }

    state_.store(SessionState::finalizing, std::memory_order_release);
    std::string session_id;
    UploadProgress progress;
    {
        std::lock_guard lock(mutex_);
        session_id = session_id_;
        progress = progress_locked();
    }
    notify(progress);
    spdlog::info("All {} chunks acked; finalizing session {}", progress.total_chunks, session_id);

    std::uint32_t attempts = 0;
    auto job = call_with_retry(
        [&] { return transport_.finalize_session(session_id, file_.checksum); },
        backoff_, config_.max_retries, stoken, "Finalize", attempts);
    if (!job) {
        return fail(failure_from(FailureKind::finalize, job.error(), attempts));
    }

    state_.store(SessionState::completed, std::memory_order_release);
    if (store_) {
        if (auto ec = store_->remove(file_.path)) {
            spdlog::warn("Could not remove session record for {}: {}", file_.path, ec.message());
        }
    }
    {
        std::lock_guard lock(mutex_);
        progress = progress_locked();
    }
    notify(progress);

    spdlog::info("Upload complete; job {}", *job);
    return std::move(*job);
}

//=============================================================================
// Helpers
//=============================================================================

std::unexpected<SessionFailure> UploadSession::fail(SessionFailure failure) {
    state_.store(SessionState::failed, std::memory_order_release);

    UploadProgress progress;
    {
        std::lock_guard lock(mutex_);
        persist_locked();
        progress = progress_locked();
    }
    notify(progress);

    if (failure.kind == FailureKind::cancelled) {
        spdlog::info("Upload stopped: {}", failure.message());
    } else {
        spdlog::error("Upload failed: {}", failure.message());
    }
    return std::unexpected(std::move(failure));
}

SessionRecord UploadSession::make_record_locked() const {
    SessionRecord record;
    record.file_path = file_.path;
    record.file_size = file_.size;
    record.checksum = file_.checksum;
    record.chunk_size = plan_.chunk_size;
    record.session_id = session_id_;
    for (std::uint32_t i = 0; i < plan_.states.size(); ++i) {
        if (plan_.states[i].status == ChunkStatus::acked) {
            record.acked.push_back(i);
        }
    }
    return record;
}

void UploadSession::persist_locked() {
    if (!store_ || session_id_.empty()) {
        return;
    }
    if (auto ec = store_->save(make_record_locked())) {
        spdlog::warn("Could not persist session record for {}: {}", file_.path, ec.message());
    }
}

UploadProgress UploadSession::progress_locked() const {
    UploadProgress p;
    p.state = state();
    p.acked_bytes = ChunkStore::acked_bytes(plan_);
    p.total_bytes = file_.size;
    p.acked_chunks = ChunkStore::acked_count(plan_);
    p.total_chunks = plan_.size();
    return p;
}

void UploadSession::notify(const UploadProgress& progress) {
    std::lock_guard lock(callback_mutex_);
    if (callback_) {
        callback_(progress);
    }
}

} // namespace scribe::core
