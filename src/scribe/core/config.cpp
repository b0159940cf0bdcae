// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/core/config.hpp>
#include <scribe/core/error.hpp>
#include <scribe/core/url.hpp>
#include <scribe/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <sstream>

namespace scribe::core {

namespace {

using nlohmann::json;

// Each reader leaves `out` untouched when the key is absent or null and
// returns false when the value has the wrong type.

bool read_string(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

bool read_bool(const json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_boolean()) return false;
    out = it->get<bool>();
    return true;
}

template<typename T>
bool read_unsigned(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_number_unsigned()) return false;
    auto value = it->get<std::uint64_t>();
    if (value > std::numeric_limits<T>::max()) return false;
    out = static_cast<T>(value);
    return true;
}

bool read_seconds(const json& j, const char* key, std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_number()) return false;
    double seconds = it->get<double>();
    if (!std::isfinite(seconds) || seconds < 0.0 || seconds > static_cast<double>(MAX_DURATION.count())) return false;
    out = std::chrono::milliseconds(std::llround(seconds * 1000.0));
    return true;
}

double to_seconds(std::chrono::milliseconds ms) noexcept {
    return static_cast<double>(ms.count()) / 1000.0;
}

} // namespace

//=============================================================================
// AudioQuality
//=============================================================================

std::string_view to_string(AudioQuality quality) noexcept {
    switch (quality) {
        case AudioQuality::best: return "best";
        case AudioQuality::good: return "good";
        case AudioQuality::fast: return "fast";
    }
    return "best";
}

std::optional<AudioQuality> parse_audio_quality(std::string_view text) noexcept {
    if (text == "best") return AudioQuality::best;
    if (text == "good") return AudioQuality::good;
    if (text == "fast") return AudioQuality::fast;
    return std::nullopt;
}

//=============================================================================
// ClientConfig
//=============================================================================

std::string ClientConfig::default_path() {
    const char* home = std::getenv("HOME");
    std::filesystem::path base = (home && *home) ? std::filesystem::path(home) : std::filesystem::path(".");
    return (base / ".scribe" / "config.json").string();
}

std::expected<ClientConfig, std::error_code>
ClientConfig::parse(std::string_view json_text) noexcept {
    try {
        json j = json::parse(json_text, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return std::unexpected(make_error_code(TransferErrc::invalid_config));
        }

        ClientConfig config;
        std::string quality{to_string(config.audio_quality)};

        bool ok = read_string(j, "server_url", config.server_url)
               && read_string(j, "api_key", config.api_key)
               && read_string(j, "download_dir", config.download_dir)
               && read_string(j, "audio_quality", quality)
               && read_bool(j, "keep_local_files", config.keep_local_files)
               && read_unsigned(j, "max_file_size", config.max_file_size)
               && read_unsigned(j, "chunk_size", config.chunk_size)
               && read_unsigned(j, "concurrency", config.concurrency)
               && read_unsigned(j, "max_retries", config.max_retries)
               && read_seconds(j, "timeout", config.timeout)
               && read_seconds(j, "connect_timeout", config.connect_timeout)
               && read_seconds(j, "retry_base_delay", config.retry_base_delay)
               && read_seconds(j, "retry_max_delay", config.retry_max_delay)
               && read_seconds(j, "poll_interval", config.poll_interval)
               && read_seconds(j, "poll_max_interval", config.poll_max_interval)
               && read_seconds(j, "max_wait", config.max_wait)
               && read_bool(j, "wait_for_job", config.wait_for_job)
               && read_string(j, "results_dir", config.results_dir)
               && read_bool(j, "save_results", config.save_results)
               && read_string(j, "state_dir", config.state_dir)
               && read_string(j, "log_file", config.log_file)
               && read_bool(j, "verbose", config.verbose);
        if (!ok) {
            return std::unexpected(make_error_code(TransferErrc::invalid_config));
        }

        auto parsed_quality = parse_audio_quality(quality);
        if (!parsed_quality) {
            return std::unexpected(make_error_code(TransferErrc::invalid_config));
        }
        config.audio_quality = *parsed_quality;

        return config;
    } catch (const json::exception&) {
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }
}

std::expected<ClientConfig, std::error_code>
ClientConfig::load(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        return parse(buffer.str());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::string ClientConfig::dump() const {
    json j = {
        {"server_url", server_url},
        {"api_key", api_key},
        {"download_dir", download_dir},
        {"audio_quality", std::string(to_string(audio_quality))},
        {"keep_local_files", keep_local_files},
        {"max_file_size", max_file_size},
        {"chunk_size", chunk_size},
        {"concurrency", concurrency},
        {"max_retries", max_retries},
        {"timeout", to_seconds(timeout)},
        {"connect_timeout", to_seconds(connect_timeout)},
        {"retry_base_delay", to_seconds(retry_base_delay)},
        {"retry_max_delay", to_seconds(retry_max_delay)},
        {"poll_interval", to_seconds(poll_interval)},
        {"poll_max_interval", to_seconds(poll_max_interval)},
        {"max_wait", to_seconds(max_wait)},
        {"wait_for_job", wait_for_job},
        {"results_dir", results_dir},
        {"save_results", save_results},
        {"state_dir", state_dir},
        {"log_file", log_file},
        {"verbose", verbose},
    };
    return j.dump(2);
}

std::error_code ClientConfig::save(std::string_view path) const noexcept {
    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        std::ofstream file(p, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(disk::DiskErrc::write_error);
        }
        file << dump() << '\n';
        return file ? std::error_code{} : make_error_code(disk::DiskErrc::write_error);
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::error_code ClientConfig::validate() const noexcept {
    auto url = Url::parse(server_url);
    if (!url || (url->scheme() != "http" && url->scheme() != "https")) {
        return make_error_code(TransferErrc::invalid_url);
    }
    if (chunk_size == 0) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (concurrency < MIN_CONCURRENCY || concurrency > MAX_CONCURRENCY) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (poll_interval.count() <= 0 || timeout.count() <= 0) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (poll_max_interval < poll_interval || retry_max_delay < retry_base_delay) {
        return make_error_code(TransferErrc::invalid_config);
    }
    for (auto d : {timeout, connect_timeout, retry_base_delay, retry_max_delay,
                   poll_interval, poll_max_interval, max_wait}) {
        if (d.count() < 0 || d > MAX_DURATION) {
            return make_error_code(TransferErrc::invalid_config);
        }
    }
    return {};
}

} // namespace scribe::core
