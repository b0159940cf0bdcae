// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace scribe::core {

constexpr std::string_view DEFAULT_SERVER_URL = "https://personalaiassistant.my";

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 8 * 1024 * 1024;        // 8 MiB
constexpr std::uint64_t DEFAULT_MAX_FILE_SIZE = 500 * 1024 * 1024;   // 500 MiB
constexpr std::uint32_t DEFAULT_CONCURRENCY = 4;
constexpr std::uint32_t MIN_CONCURRENCY = 1;
constexpr std::uint32_t MAX_CONCURRENCY = 16;
constexpr std::uint32_t DEFAULT_MAX_RETRIES = 3;

constexpr std::chrono::seconds DEFAULT_TIMEOUT{300};
constexpr std::chrono::seconds DEFAULT_CONNECT_TIMEOUT{30};
constexpr std::chrono::milliseconds DEFAULT_RETRY_BASE_DELAY{500};
constexpr std::chrono::milliseconds DEFAULT_RETRY_MAX_DELAY{30'000};
constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{5'000};
constexpr std::chrono::milliseconds DEFAULT_POLL_MAX_INTERVAL{60'000};
constexpr std::chrono::milliseconds DEFAULT_MAX_WAIT{600'000};

constexpr std::uint32_t MAX_REDIRECTS = 10;

// Longest accepted duration setting (one year)
constexpr std::chrono::seconds MAX_DURATION{366LL * 24 * 3600};

enum class AudioQuality : std::uint8_t {
    best,
    good,
    fast
};

[[nodiscard]] std::string_view to_string(AudioQuality quality) noexcept;
[[nodiscard]] std::optional<AudioQuality> parse_audio_quality(std::string_view text) noexcept;

// Client configuration. Durations are stored as std::chrono types and
// serialized as (possibly fractional) seconds.
struct ClientConfig {
    std::string server_url{DEFAULT_SERVER_URL};
    std::string api_key;
    std::string download_dir{"./downloads"};
    AudioQuality audio_quality{AudioQuality::best};
    bool keep_local_files{false};
    std::uint64_t max_file_size{DEFAULT_MAX_FILE_SIZE};

    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};
    std::uint32_t max_retries{DEFAULT_MAX_RETRIES};
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT};
    std::chrono::milliseconds connect_timeout{DEFAULT_CONNECT_TIMEOUT};
    std::chrono::milliseconds retry_base_delay{DEFAULT_RETRY_BASE_DELAY};
    std::chrono::milliseconds retry_max_delay{DEFAULT_RETRY_MAX_DELAY};

    std::chrono::milliseconds poll_interval{DEFAULT_POLL_INTERVAL};
    std::chrono::milliseconds poll_max_interval{DEFAULT_POLL_MAX_INTERVAL};
    std::chrono::milliseconds max_wait{DEFAULT_MAX_WAIT};
    bool wait_for_job{true};   // false: stop once the job is submitted

    std::string results_dir{"./results"};
    bool save_results{false};  // Write transcription_<job>.json into results_dir
    std::string state_dir;   // Empty: session records live next to the media file
    std::string log_file;
    bool verbose{false};

    // ~/.scribe/config.json
    [[nodiscard]] static std::string default_path();

    // Parse a JSON document. Unknown keys are ignored, mistyped keys rejected.
    [[nodiscard]] static std::expected<ClientConfig, std::error_code>
    parse(std::string_view json_text) noexcept;

    [[nodiscard]] static std::expected<ClientConfig, std::error_code>
    load(std::string_view path) noexcept;

    [[nodiscard]] std::string dump() const;

    [[nodiscard]] std::error_code save(std::string_view path) const noexcept;

    [[nodiscard]] std::error_code validate() const noexcept;
};

} // namespace scribe::core
