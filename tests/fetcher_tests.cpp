// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <scribe/disk/checksum.hpp>
#include <scribe/media/fetcher.hpp>
#include <scribe/media/process.hpp>
#include <scribe/media/ytdlp_fetcher.hpp>
#include "test_support.hpp"

using namespace scribe;
using namespace scribe::media;
using namespace scribe::test;

namespace {

constexpr std::string_view VIDEO_URL = "https://www.youtube.com/watch?v=abc123";

bool has_arg(const std::vector<std::string>& argv, std::string_view arg) {
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

std::string arg_after(const std::vector<std::string>& argv, std::string_view flag) {
    auto it = std::find(argv.begin(), argv.end(), flag);
    return (it != argv.end() && std::next(it) != argv.end()) ? *std::next(it) : std::string{};
}

// Plays yt-dlp: answers the metadata query, then "downloads" by writing
// the output template with a .mp3 extension.
struct ScriptedYtDlp {
    std::string info_json{R"({"title":"Lecture: Intro/Overview","uploader":"Uni","duration":3600.5,"ext":"webm","filesize_approx":5000})"};
    std::size_t download_size{2'048};
    bool print_path{true};
    int download_exit{0};
    std::string download_output;
    std::vector<std::vector<std::string>> calls;

    std::expected<ProcessResult, std::error_code> operator()(const std::vector<std::string>& argv) {
        calls.push_back(argv);
        if (has_arg(argv, "--dump-single-json")) {
            return ProcessResult{0, "[youtube] abc123: Downloading webpage\n" + info_json + "\n"};
        }
        if (download_exit != 0) {
            return ProcessResult{download_exit, download_output};
        }

        auto templ = arg_after(argv, "-o");
        auto marker = templ.find(".%(ext)s");
        auto path = templ.substr(0, marker) + ".mp3";
        write_file(path, pattern_bytes(download_size));
        return ProcessResult{0, print_path ? path + "\n" : std::string("[ExtractAudio] done\n")};
    }
};

core::ClientConfig config_for(const TempDir& dir) {
    core::ClientConfig config;
    config.download_dir = dir.file("downloads");
    config.max_file_size = 1'000'000;
    return config;
}

} // namespace

TEST_CASE("YtDlpFetcher::format_selector", "[fetcher]") {
    CHECK(YtDlpFetcher::format_selector(core::AudioQuality::best) == "bestaudio/best");
    CHECK(YtDlpFetcher::format_selector(core::AudioQuality::good) == "bestaudio[abr<=128]/best[abr<=128]");
    CHECK(YtDlpFetcher::format_selector(core::AudioQuality::fast) == "worstaudio/worst");
}

TEST_CASE("YtDlpFetcher::sanitize_filename", "[fetcher]") {
    CHECK(YtDlpFetcher::sanitize_filename("plain title") == "plain title");
    CHECK(YtDlpFetcher::sanitize_filename("a<b>c:d\"e/f\\g|h?i*j") == "a_b_c_d_e_f_g_h_i_j");
    CHECK(YtDlpFetcher::sanitize_filename(std::string(500, 'x')).size() == MAX_FILENAME_LENGTH);
}

TEST_CASE("YtDlpFetcher::classify_failure", "[fetcher]") {
    SECTION("Missing executable") {
        auto error = YtDlpFetcher::classify_failure({127, "sh: 1: yt-dlp: not found\n"});
        CHECK(error.code == FetchErrc::tool_missing);
    }

    SECTION("Unsupported source") {
        auto error = YtDlpFetcher::classify_failure({1, "ERROR: Unsupported URL: https://example.com/page\n"});
        CHECK(error.code == FetchErrc::unsupported_source);
        CHECK(error.detail == "ERROR: Unsupported URL: https://example.com/page");
    }

    SECTION("Restricted content") {
        for (std::string_view text : {"ERROR: [youtube] x: Private video. Sign in if you've been granted access",
                                      "ERROR: [youtube] x: Sign in to confirm your age",
                                      "ERROR: [youtube] x: Video unavailable"}) {
            auto error = YtDlpFetcher::classify_failure({1, std::string(text)});
            CHECK(error.code == FetchErrc::restricted_content);
        }
    }

    SECTION("Network failure") {
        auto error = YtDlpFetcher::classify_failure({1, "WARNING: retrying\nERROR: Unable to download webpage: HTTP Error 503\n"});
        CHECK(error.code == FetchErrc::network_error);
        CHECK_THAT(error.detail, Catch::Matchers::StartsWith("ERROR:"));
    }

    SECTION("Anything else") {
        auto error = YtDlpFetcher::classify_failure({2, "ERROR: Postprocessing: ffprobe not found\n"});
        CHECK(error.code == FetchErrc::download_failed);
    }
}

TEST_CASE("YtDlpFetcher::fetch", "[fetcher]") {
    TempDir dir;
    auto config = config_for(dir);
    ScriptedYtDlp script;

    YtDlpFetcher fetcher(config);
    auto use_script = [&] {
        fetcher.runner([&](const std::vector<std::string>& argv) { return script(argv); });
    };

    SECTION("Downloads, hashes and describes the media") {
        use_script();
        auto result = fetcher.fetch(VIDEO_URL);
        REQUIRE(result.has_value());

        CHECK(result->owned);
        CHECK(result->info.title == "Lecture: Intro/Overview");
        CHECK(result->info.uploader == "Uni");
        CHECK(result->info.duration == std::optional<double>(3600.5));
        CHECK(result->info.source_url == VIDEO_URL);
        CHECK(result->info.format == "mp3");
        CHECK(result->file.size == 2'048);
        CHECK(result->file.checksum == disk::sha256_hex(pattern_bytes(2'048)).value());
        CHECK(fs::exists(result->file.path));
        CHECK_THAT(result->file.filename(), Catch::Matchers::StartsWith("Lecture_ Intro_Overview_"));

        REQUIRE(script.calls.size() == 2);
        const auto& argv = script.calls[1];
        CHECK(argv.front() == "yt-dlp");
        CHECK(arg_after(argv, "-f") == "bestaudio/best");
        CHECK(arg_after(argv, "--audio-format") == "mp3");
        CHECK(arg_after(argv, "--audio-quality") == "0");
        CHECK(arg_after(argv, "--") == VIDEO_URL);
        CHECK(argv.back() == VIDEO_URL);
    }

    SECTION("Fast quality") {
        config.audio_quality = core::AudioQuality::fast;
        YtDlpFetcher fast(config);
        fast.runner([&](const std::vector<std::string>& argv) { return script(argv); });
        REQUIRE(fast.fetch(VIDEO_URL).has_value());
        CHECK(arg_after(script.calls[1], "-f") == "worstaudio/worst");
        CHECK(arg_after(script.calls[1], "--audio-quality") == "5");
    }

    SECTION("Finds the file when yt-dlp prints no path") {
        script.print_path = false;
        use_script();
        auto result = fetcher.fetch(VIDEO_URL);
        REQUIRE(result.has_value());
        CHECK(result->file.size == 2'048);
    }

    SECTION("Rejects media announced as too large") {
        script.info_json = R"({"title":"Huge","filesize_approx":5000000})";
        use_script();
        auto result = fetcher.fetch(VIDEO_URL);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == FetchErrc::too_large);
        CHECK(script.calls.size() == 1);
    }

    SECTION("Rejects and removes media that turns out too large") {
        script.download_size = 1'500'000;
        use_script();
        auto result = fetcher.fetch(VIDEO_URL);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == FetchErrc::too_large);
        CHECK(fs::is_empty(dir.file("downloads")));
    }

    SECTION("Download failure is classified") {
        script.download_exit = 1;
        script.download_output = "ERROR: [youtube] abc123: Private video\n";
        use_script();
        auto result = fetcher.fetch(VIDEO_URL);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == FetchErrc::restricted_content);
    }

    SECTION("Metadata query prints no JSON") {
        script.info_json = "nothing useful";
        use_script();
        auto result = fetcher.fetch(VIDEO_URL);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == FetchErrc::download_failed);
    }

    SECTION("Stop before starting") {
        use_script();
        std::stop_source stop;
        stop.request_stop();
        auto result = fetcher.fetch(VIDEO_URL, stop.get_token());
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == FetchErrc::cancelled);
        CHECK(script.calls.empty());
    }
}

TEST_CASE("YtDlpFetcher::tool_version", "[fetcher]") {
    core::ClientConfig config;
    YtDlpFetcher fetcher(config);
    std::vector<std::vector<std::string>> calls;

    SECTION("Reports the first line yt-dlp prints") {
        fetcher.runner([&](const std::vector<std::string>& argv) -> std::expected<ProcessResult, std::error_code> {
            calls.push_back(argv);
            return ProcessResult{0, "\n2024.08.06\n"};
        });
        auto version = fetcher.tool_version();
        REQUIRE(version.has_value());
        CHECK(*version == "2024.08.06");
        REQUIRE(calls.size() == 1);
        CHECK(calls[0] == std::vector<std::string>{"yt-dlp", "--version"});
    }

    SECTION("Command not found") {
        fetcher.runner([](const std::vector<std::string>&) -> std::expected<ProcessResult, std::error_code> {
            return ProcessResult{127, "sh: 1: yt-dlp: not found\n"};
        });
        auto version = fetcher.tool_version();
        REQUIRE_FALSE(version.has_value());
        CHECK(version.error().code == FetchErrc::tool_missing);
    }

    SECTION("Process could not be started") {
        fetcher.runner([](const std::vector<std::string>&) -> std::expected<ProcessResult, std::error_code> {
            return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
        });
        auto version = fetcher.tool_version();
        REQUIRE_FALSE(version.has_value());
        CHECK(version.error().code == FetchErrc::tool_missing);
    }

    SECTION("Silent success is not a version") {
        fetcher.runner([](const std::vector<std::string>&) -> std::expected<ProcessResult, std::error_code> {
            return ProcessResult{0, ""};
        });
        auto version = fetcher.tool_version();
        REQUIRE_FALSE(version.has_value());
        CHECK(version.error().code == FetchErrc::tool_missing);
    }
}

TEST_CASE("LocalFileFetcher", "[fetcher]") {
    TempDir dir;
    const auto path = dir.file("memo.m4a");
    write_file(path, pattern_bytes(600));

    SECTION("Accepts paths and file URLs") {
        CHECK(LocalFileFetcher::accepts("/tmp/a.mp3"));
        CHECK(LocalFileFetcher::accepts("relative/a.mp3"));
        CHECK(LocalFileFetcher::accepts("file:///tmp/a.mp3"));
        CHECK_FALSE(LocalFileFetcher::accepts("https://example.com/a.mp3"));
    }

    SECTION("Existing file is not owned") {
        LocalFileFetcher fetcher;
        auto result = fetcher.fetch(path);
        REQUIRE(result.has_value());
        CHECK_FALSE(result->owned);
        CHECK(result->file.size == 600);
        CHECK(result->info.title == "memo");
        CHECK(result->info.format == "m4a");
    }

    SECTION("file:// URL") {
        LocalFileFetcher fetcher;
        auto result = fetcher.fetch("file://" + path);
        REQUIRE(result.has_value());
        CHECK(result->file.size == 600);
    }

    SECTION("Missing file") {
        LocalFileFetcher fetcher;
        auto result = fetcher.fetch(dir.file("gone.mp3"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == FetchErrc::not_found);
    }

    SECTION("Too large") {
        LocalFileFetcher fetcher(100);
        auto result = fetcher.fetch(path);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == FetchErrc::too_large);
    }
}

TEST_CASE("make_fetcher", "[fetcher]") {
    core::ClientConfig config;

    auto local = make_fetcher("/tmp/a.mp3", config);
    REQUIRE(local.has_value());
    CHECK(dynamic_cast<LocalFileFetcher*>(local->get()) != nullptr);

    auto remote = make_fetcher(VIDEO_URL, config);
    REQUIRE(remote.has_value());
    CHECK(dynamic_cast<YtDlpFetcher*>(remote->get()) != nullptr);

    auto unsupported = make_fetcher("ftp://example.com/a.mp3", config);
    REQUIRE_FALSE(unsupported.has_value());
    CHECK(unsupported.error().code == FetchErrc::unsupported_source);
}

TEST_CASE("run_process", "[process]") {
    SECTION("Captures output and exit code") {
        auto result = run_process({"sh", "-c", "echo out; echo err >&2; exit 3"});
        REQUIRE(result.has_value());
        CHECK(result->exit_code == 3);
        CHECK(result->lines() == std::vector<std::string>{"out", "err"});
    }

    SECTION("Arguments are passed verbatim") {
        auto result = run_process({"printf", "%s|", "it's", "a b", "$HOME"});
        REQUIRE(result.has_value());
        CHECK(result->exit_code == 0);
        CHECK(result->output == "it's|a b|$HOME|");
    }

    SECTION("Missing program") {
        auto result = run_process({"scribe-no-such-tool-xyz"});
        REQUIRE(result.has_value());
        CHECK(result->exit_code == 127);
    }
}

TEST_CASE("shell_quote", "[process]") {
    CHECK(shell_quote("plain") == "'plain'");
    CHECK(shell_quote("it's") == "'it'\\''s'");
    CHECK(shell_quote("") == "''");
}
