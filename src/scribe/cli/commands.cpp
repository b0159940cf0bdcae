// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/cli/commands.hpp>
#include <scribe/cli/progress_bar.hpp>
#include <scribe/core/http_session.hpp>
#include <scribe/core/http_transport.hpp>
#include <scribe/core/orchestrator.hpp>
#include <scribe/core/session_store.hpp>
#include <scribe/media/fetcher.hpp>
#include <scribe/media/ytdlp_fetcher.hpp>
#include <scribe/version.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iostream>

namespace chrono = std::chrono;

namespace scribe::cli {

namespace {

// curl_global_init / curl_global_cleanup for the duration of a command
struct CurlGlobal {
    CurlGlobal() noexcept { core::HttpSession::global_init(); }
    ~CurlGlobal() { core::HttpSession::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

bool parse_unsigned(const char* text, std::uint64_t& out) {
    if (text == nullptr || *text == '\0' || *text == '-') return false;
    char* end = nullptr;
    errno = 0;
    const auto value = std::strtoull(text, &end, 10);
    if (end == nullptr || *end != '\0' || errno == ERANGE) return false;
    out = value;
    return true;
}

std::string describe_job(const core::TranscriptionJob& job) {
    std::string text = "Transcribing: " + std::string(core::to_string(job.status));
    if (job.progress) {
        text += " (" + std::to_string(static_cast<int>(*job.progress)) + "%)";
    }
    text += " [" + std::to_string(job.elapsed.count() / 1000) + "s]";
    return text;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    // Fetch the value of an option that takes one
    auto value = [&](int& i, std::string_view name) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.error = "Missing value for " + std::string(name);
        return nullptr;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-k" || arg == "--keep-local") {
            args.keep_local = true;
        } else if (arg == "--test") {
            args.test_connection = true;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value(i, arg)) args.config_path = v;
        } else if (arg == "-s" || arg == "--server") {
            if (auto v = value(i, arg)) args.server_url = v;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value(i, arg)) args.output_dir = v;
        } else if (arg == "--save-result") {
            args.save_result = true;
        } else if (arg == "-r" || arg == "--results-dir") {
            if (auto v = value(i, arg)) args.results_dir = v;
        } else if (arg == "--no-wait") {
            args.no_wait = true;
        } else if (arg == "-Q" || arg == "--quality") {
            if (auto v = value(i, arg)) {
                args.quality = core::parse_audio_quality(v);
                if (!args.quality) {
                    args.error = "Invalid quality '" + std::string(v) + "' (expected best, good or fast)";
                }
            }
        } else if (arg == "-n" || arg == "--concurrency") {
            if (auto v = value(i, arg)) {
                std::uint64_t n = 0;
                if (!parse_unsigned(v, n) || n < core::MIN_CONCURRENCY || n > core::MAX_CONCURRENCY) {
                    args.error = "Invalid concurrency '" + std::string(v) + "' (expected "
                               + std::to_string(core::MIN_CONCURRENCY) + "-"
                               + std::to_string(core::MAX_CONCURRENCY) + ")";
                } else {
                    args.concurrency = static_cast<std::uint32_t>(n);
                }
            }
        } else if (arg == "--chunk-size") {
            if (auto v = value(i, arg)) {
                std::uint64_t n = 0;
                if (!parse_unsigned(v, n) || n == 0) {
                    args.error = "Invalid chunk size '" + std::string(v) + "'";
                } else {
                    args.chunk_size = n;
                }
            }
        } else if (arg == "--max-wait") {
            if (auto v = value(i, arg)) {
                std::uint64_t n = 0;
                if (!parse_unsigned(v, n) || n == 0 || n > static_cast<std::uint64_t>(core::MAX_DURATION.count())) {
                    args.error = "Invalid max wait '" + std::string(v) + "'";
                } else {
                    args.max_wait = chrono::seconds(n);
                }
            }
        } else if (arg.size() > 1 && arg.front() == '-') {
            args.error = "Unknown option " + arg;
        } else {
            // URL or local file
            args.sources.push_back(arg);
        }
    }

    return args;
}

void apply_overrides(const CliArgs& args, core::ClientConfig& config) {
    if (args.server_url) config.server_url = *args.server_url;
    if (args.output_dir) config.download_dir = *args.output_dir;
    if (args.quality) config.audio_quality = *args.quality;
    if (args.concurrency) config.concurrency = *args.concurrency;
    if (args.chunk_size) config.chunk_size = *args.chunk_size;
    if (args.max_wait) config.max_wait = *args.max_wait;
    if (args.keep_local) config.keep_local_files = true;
    if (args.results_dir) config.results_dir = *args.results_dir;
    if (args.save_result) config.save_results = true;
    if (args.no_wait) config.wait_for_job = false;
    if (args.verbose) config.verbose = true;
}

//=============================================================================
// Commands
//=============================================================================

int transcribe(std::string_view source,
               const core::ClientConfig& config,
               bool quiet,
               std::stop_token stoken) {
    CurlGlobal curl;

    auto fetcher = media::make_fetcher(source, config);
    if (!fetcher) {
        std::cerr << "Error: " << fetcher.error().message() << std::endl;
        return EXIT_USAGE;
    }

    auto transport = core::HttpTransport::create(config);
    if (!transport) {
        std::cerr << "Error: Invalid server URL " << config.server_url << ": "
                  << transport.error().message() << std::endl;
        return EXIT_USAGE;
    }

    core::FileSessionStore store(config.state_dir);
    core::Orchestrator orchestrator(**fetcher, *transport, &store);

    ProgressBar bar(0, "Uploading");
    Spinner spinner;
    bool bar_done = false;
    auto upload_start = chrono::steady_clock::now();

    if (!quiet) {
        orchestrator.callback([&](const core::RunProgress& p) {
            switch (p.stage) {
                case core::Stage::fetch:
                    spinner.update("Fetching " + std::string(source));
                    break;
                case core::Stage::upload: {
                    if (!p.upload) break;
                    if (p.upload->state == core::SessionState::building) {
                        spinner.clear();
                        upload_start = chrono::steady_clock::now();
                        break;
                    }
                    bar.total(p.upload->total_bytes);
                    auto elapsed = chrono::duration<double>(chrono::steady_clock::now() - upload_start).count();
                    std::uint64_t speed = elapsed > 0.0
                        ? static_cast<std::uint64_t>(static_cast<double>(p.upload->acked_bytes) / elapsed)
                        : 0;
                    bar.update(p.upload->acked_bytes, speed);
                    if (p.upload->state == core::SessionState::finalizing && !bar_done) {
                        bar.finish();
                        bar_done = true;
                    }
                    break;
                }
                case core::Stage::track:
                    if (p.job) spinner.update(describe_job(*p.job));
                    break;
            }
        });
    }

    auto result = orchestrator.run(source, config, stoken);

    if (!quiet) {
        spinner.clear();
    }

    if (!result) {
        const auto& error = result.error();
        if (error.cancelled()) {
            std::cerr << "Cancelled during " << core::to_string(error.stage) << std::endl;
            return EXIT_CANCELLED;
        }
        spdlog::error("{}", error.message());
        std::cerr << "Error: " << error.message() << std::endl;
        return EXIT_RUN_FAILED;
    }

    if (config.wait_for_job) {
        std::cout << "Transcription complete" << std::endl;
    } else {
        std::cout << "Upload complete, job submitted" << std::endl;
    }
    std::cout << "Job: " << result->job.id << std::endl;
    if (!result->media.title.empty()) {
        std::cout << "Title: " << result->media.title << std::endl;
    }
    if (result->job.result_ref) {
        std::cout << "Result: " << *result->job.result_ref << std::endl;
    }

    if (config.save_results) {
        auto saved = core::Orchestrator::save_result(*result, config.results_dir);
        if (!saved) {
            std::cerr << "Error: Could not save result to " << config.results_dir << ": "
                      << saved.error().message() << std::endl;
            return EXIT_RUN_FAILED;
        }
        std::cout << "Saved: " << *saved << std::endl;
    }

    return EXIT_OK;
}

int test_connection(const core::ClientConfig& config, std::stop_token stoken) {
    CurlGlobal curl;
    bool ok = true;

    std::cout << "Server:        " << config.server_url << std::endl;
    std::cout << "Download dir:  " << config.download_dir << std::endl;
    std::cout << "Audio quality: " << core::to_string(config.audio_quality) << std::endl;

    media::YtDlpFetcher ytdlp(config);
    auto version = ytdlp.tool_version();
    if (version) {
        std::cout << "yt-dlp:        " << *version << std::endl;
    } else {
        std::cerr << "Error: yt-dlp unavailable: " << version.error().message() << std::endl;
        ok = false;
    }

    std::cout << "Testing connection to " << config.server_url << std::endl;
    auto status = core::Orchestrator::check_connection(config, stoken);
    if (!status) {
        if (status.error().code == core::TransferErrc::cancelled) {
            return EXIT_CANCELLED;
        }
        std::cerr << "Error: Server unreachable: " << status.error().message() << std::endl;
        return EXIT_RUN_FAILED;
    }
    std::cout << "Server reachable (HTTP " << *status << ")" << std::endl;

    return ok ? EXIT_OK : EXIT_RUN_FAILED;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Scribe " << scribe::version.to_string() << " - Chunked upload client for remote transcription\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL|FILE>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                Show this help message\n";
    std::cout << "  -v, --version             Show version information\n";
    std::cout << "  -V, --verbose             Enable debug logging\n";
    std::cout << "  -q, --quiet               Quiet mode (warnings and errors only, no progress)\n";
    std::cout << "  -c, --config <FILE>       Config file (default: ~/.scribe/config.json)\n";
    std::cout << "  -s, --server <URL>        Transcription server URL\n";
    std::cout << "  -o, --output <DIR>        Directory for downloaded media\n";
    std::cout << "  -Q, --quality <Q>         Audio quality: best, good, fast (default: best)\n";
    std::cout << "  -k, --keep-local          Keep downloaded media after upload\n";
    std::cout << "  -n, --concurrency <N>     Parallel chunk uploads (1-16, default: 4)\n";
    std::cout << "      --chunk-size <BYTES>  Upload chunk size (default: 8 MiB)\n";
    std::cout << "      --max-wait <SECONDS>  Give up waiting for the job after this long\n";
    std::cout << "      --no-wait             Exit once the job is submitted\n";
    std::cout << "      --save-result         Write the final job report to the results directory\n";
    std::cout << "  -r, --results-dir <DIR>   Results directory (default: ./results)\n";
    std::cout << "      --test                Check yt-dlp and the server, then exit\n";
    std::cout << "\n";
    std::cout << "EXIT CODES:\n";
    std::cout << "  0 success, 1 run failed, 2 usage or config error, 130 cancelled\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://www.youtube.com/watch?v=dQw4w9WgXcQ\n";
    std::cout << "  " << program_name << " -Q fast --save-result lecture.mp3\n";
    std::cout << "  " << program_name << " --no-wait https://youtu.be/dQw4w9WgXcQ\n";
    std::cout << "  " << program_name << " -s http://localhost:8000 --test\n";
}

void print_version() noexcept {
    std::cout << "Scribe " << scribe::version.to_string() << std::endl;
    std::cout << "Built " << scribe::BUILD_DATE << " " << scribe::BUILD_TIME << std::endl;
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, nlohmann/json, spdlog, OpenSSL\n";
}

} // namespace scribe::cli
