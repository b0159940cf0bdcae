// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scribe/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace scribe::cli {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_RUN_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CANCELLED = 130;

// Command line arguments. Optional fields override the config file.
struct CliArgs {
    std::vector<std::string> sources;
    std::string config_path;
    std::optional<std::string> server_url;
    std::optional<std::string> output_dir;
    std::optional<core::AudioQuality> quality;
    std::optional<std::uint32_t> concurrency;
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::chrono::milliseconds> max_wait;
    std::optional<std::string> results_dir;
    bool save_result{false};
    bool no_wait{false};
    bool keep_local{false};
    bool test_connection{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};

    // Set when the command line is unusable
    std::string error;
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Fold command line overrides into a loaded config
void apply_overrides(const CliArgs& args, core::ClientConfig& config);

// fetch -> upload -> track one source; returns a process exit code
[[nodiscard]] int transcribe(std::string_view source,
                             const core::ClientConfig& config,
                             bool quiet,
                             std::stop_token stoken);

// Check yt-dlp and the configured server; returns a process exit code
[[nodiscard]] int test_connection(const core::ClientConfig& config, std::stop_token stoken);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace scribe::cli
