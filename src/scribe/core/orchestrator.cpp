// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/orchestrator.hpp>
#include <scribe/core/http_transport.hpp>
#include <scribe/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace scribe::core {

namespace {

using nlohmann::json;

// Deletes a fetched file when the run ends, unless told to keep it
class FetchedFileCleanup {
public:
    FetchedFileCleanup(std::string path, SessionStore* store, bool active)
        : path_(std::move(path))
        , store_(store)
        , active_(active) {}

    ~FetchedFileCleanup() {
        if (!active_) return;

        std::error_code ec;
        if (std::filesystem::remove(path_, ec)) {
            spdlog::info("Removed local file {}", path_);
        } else if (ec) {
            spdlog::warn("Could not remove {}: {}", path_, ec.message());
        }
        if (store_) {
            if (auto rec = store_->remove(path_)) {
                spdlog::warn("Could not remove session record for {}: {}", path_, rec.message());
            }
        }
    }

    FetchedFileCleanup(const FetchedFileCleanup&) = delete;
    FetchedFileCleanup& operator=(const FetchedFileCleanup&) = delete;

private:
    std::string path_;
    SessionStore* store_;
    bool active_;
};

std::string safe_id(std::string_view id) {
    std::string out;
    out.reserve(id.size());
    for (char c : id) {
        auto uc = static_cast<unsigned char>(c);
        out += (std::isalnum(uc) || c == '-' || c == '_' || c == '.') ? c : '_';
    }
    return out.empty() ? std::string("unknown") : out;
}

} // namespace

std::string_view to_string(Stage stage) noexcept {
    switch (stage) {
        case Stage::fetch:  return "fetch";
        case Stage::upload: return "upload";
        case Stage::track:  return "track";
    }
    return "unknown";
}

//=============================================================================
// OrchestrationError
//=============================================================================

bool OrchestrationError::cancelled() const noexcept {
    if (upload_failure == FailureKind::cancelled || track_failure == TrackErrorKind::client_cancelled) {
        return true;
    }
    return code == TransferErrc::cancelled || code == media::FetchErrc::cancelled;
}

std::string OrchestrationError::message() const {
    std::string out = std::string(to_string(stage)) + " stage failed";
    if (chunk_index) {
        out += " (chunk " + std::to_string(*chunk_index) + ")";
    }
    out += ": ";
    out += code ? code.message() : std::string("unknown error");
    if (!detail.empty()) {
        out += " - " + detail;
    }
    return out;
}

//=============================================================================
// Orchestrator
//=============================================================================

std::expected<RunResult, OrchestrationError>
Orchestrator::run(std::string_view source_url, const ClientConfig& config, std::stop_token stoken) {
    RunResult result;

    // Fetch
    notify({Stage::fetch, std::nullopt, std::nullopt});
    spdlog::info("Fetching {}", source_url);
    auto fetched = fetcher_.fetch(source_url, stoken);
    if (!fetched) {
        OrchestrationError error;
        error.stage = Stage::fetch;
        error.code = fetched.error().code;
        error.detail = fetched.error().detail;
        spdlog::error("{}", error.message());
        return std::unexpected(std::move(error));
    }

    result.media = fetched->info;
    result.file_path = fetched->file.path;
    result.file_size = fetched->file.size;

    FetchedFileCleanup cleanup(fetched->file.path, store_, fetched->owned && !config.keep_local_files);

    // Upload
    notify({Stage::upload, UploadProgress{SessionState::building, 0, fetched->file.size, 0, 0}, std::nullopt});
    UploadSession session(fetched->file, config, transport_, store_);
    session.callback([this](const UploadProgress& p) {
        notify({Stage::upload, p, std::nullopt});
    });

    auto job_id = session.drive_to_completion(stoken);
    if (!job_id) {
        const auto& failure = job_id.error();
        OrchestrationError error;
        error.stage = Stage::upload;
        error.code = failure.code;
        error.chunk_index = failure.chunk_index;
        error.upload_failure = failure.kind;
        error.detail = failure.message();
        return std::unexpected(std::move(error));
    }

    if (!config.wait_for_job) {
        spdlog::info("Submitted job {}; not waiting for it", *job_id);
        result.job.id = std::move(*job_id);
        result.job.status = JobStatus::queued;
        return result;
    }

    // Track
    JobTracker tracker(transport_);
    tracker.max_interval(config.poll_max_interval);
    tracker.callback([this](const TranscriptionJob& job) {
        notify({Stage::track, std::nullopt, job});
    });
    notify({Stage::track, std::nullopt, TranscriptionJob{*job_id}});

    auto job = tracker.await(*job_id, config.poll_interval, config.max_wait, stoken);
    if (!job) {
        const auto& failure = job.error();
        OrchestrationError error;
        error.stage = Stage::track;
        error.code = failure.code;
        error.track_failure = failure.kind;
        error.detail = failure.message();
        return std::unexpected(std::move(error));
    }

    result.job = std::move(*job);
    return result;
}

void Orchestrator::notify(const RunProgress& progress) {
    if (callback_) {
        callback_(progress);
    }
}

std::expected<std::string, std::error_code>
Orchestrator::save_result(const RunResult& result, std::string_view dir) noexcept {
    try {
        std::filesystem::path out_dir(dir);
        std::error_code ec;
        std::filesystem::create_directories(out_dir, ec);
        if (ec) {
            return std::unexpected(make_error_code(disk::DiskErrc::write_error));
        }

        json doc = {
            {"job_id", result.job.id},
            {"status", std::string(to_string(result.job.status))},
            {"source", result.media.source_url},
            {"title", result.media.title},
            {"file", result.file_path},
            {"file_size", result.file_size},
        };
        if (result.job.result_ref) doc["result"] = *result.job.result_ref;
        if (result.job.error) doc["error"] = *result.job.error;
        if (result.job.progress) doc["progress"] = *result.job.progress;

        // Keep the server's own report intact when it is JSON
        json raw = json::parse(result.job.raw, nullptr, false);
        if (!raw.is_discarded()) {
            doc["server_response"] = std::move(raw);
        } else if (!result.job.raw.empty()) {
            doc["server_response"] = result.job.raw;
        }

        auto path = out_dir / ("transcription_" + safe_id(result.job.id) + ".json");
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::write_error));
        }
        file << doc.dump(2) << '\n';
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::write_error));
        }
        return path.string();
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::write_error));
    }
}

std::expected<std::int32_t, TransportError>
Orchestrator::check_connection(const ClientConfig& config, std::stop_token stoken) {
    auto transport = HttpTransport::create(config);
    if (!transport) {
        return std::unexpected(TransportError::from_code(transport.error(), config.server_url));
    }
    return transport->check_health(std::move(stoken));
}

} // namespace scribe::core
