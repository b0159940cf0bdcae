// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/core/config.hpp>
#include <scribe/core/job_tracker.hpp>
#include <scribe/core/session_store.hpp>
#include <scribe/core/transport.hpp>
#include <scribe/core/upload_session.hpp>
#include <scribe/media/fetcher.hpp>
#include <expected>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace scribe::core {

enum class Stage : std::uint8_t {
    fetch,
    upload,
    track
};

[[nodiscard]] std::string_view to_string(Stage stage) noexcept;

struct OrchestrationError {
    Stage stage{Stage::fetch};
    std::error_code code;
    std::optional<std::uint32_t> chunk_index;
    std::optional<FailureKind> upload_failure;
    std::optional<TrackErrorKind> track_failure;
    std::string detail;

    // Stopped by the caller (not a server-side cancellation)
    [[nodiscard]] bool cancelled() const noexcept;
    [[nodiscard]] std::string message() const;
};

struct RunProgress {
    Stage stage{Stage::fetch};
    std::optional<UploadProgress> upload;
    std::optional<TranscriptionJob> job;
};

using RunCallback = std::function<void(const RunProgress&)>;

struct RunResult {
    TranscriptionJob job;
    media::MediaInfo media;
    std::string file_path;
    std::uint64_t file_size{0};
};

// fetch -> upload -> track. The first failing stage ends the run; nothing
// is retried across stages. With wait_for_job off the run ends at upload and
// the result carries the queued job id.
class Orchestrator {
public:
    Orchestrator(media::Fetcher& fetcher, Transport& transport, SessionStore* store = nullptr) noexcept
        : fetcher_(fetcher)
        , transport_(transport)
        , store_(store) {}

    void callback(RunCallback cb) { callback_ = std::move(cb); }

    [[nodiscard]] std::expected<RunResult, OrchestrationError>
    run(std::string_view source_url, const ClientConfig& config, std::stop_token stoken = {});

    // Writes <dir>/transcription_<job id>.json and returns its path
    [[nodiscard]] static std::expected<std::string, std::error_code>
    save_result(const RunResult& result, std::string_view dir) noexcept;

    // GET /health, then GET /. Returns the HTTP status that answered.
    [[nodiscard]] static std::expected<std::int32_t, TransportError>
    check_connection(const ClientConfig& config, std::stop_token stoken = {});

private:
    void notify(const RunProgress& progress);

    media::Fetcher& fetcher_;
    Transport& transport_;
    SessionStore* store_;
    RunCallback callback_;
};

} // namespace scribe::core
