// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/cli/commands.hpp>
#include <scribe/core/config.hpp>
#include <scribe/core/log.hpp>
#include <scribe/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <expected>
#include <iostream>
#include <stop_token>
#include <thread>

using namespace scribe::cli;

namespace {

volatile std::sig_atomic_t g_signal = 0;

extern "C" void on_signal(int sig) {
    g_signal = sig;
}

// Terminate handler to report exceptions escaping noexcept functions
void scribe_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto ex = std::current_exception()) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

std::expected<scribe::core::ClientConfig, std::error_code> load_config(const CliArgs& args) {
    using scribe::core::ClientConfig;

    if (!args.config_path.empty()) {
        return ClientConfig::load(args.config_path);
    }

    // The default location is optional
    auto config = ClientConfig::load(ClientConfig::default_path());
    if (!config && config.error() == scribe::disk::DiskErrc::file_not_found) {
        return ClientConfig{};
    }
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    std::set_terminate(scribe_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }
    if (args.version) {
        print_version();
        return EXIT_OK;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_USAGE;
    }
    if (args.sources.size() > 1) {
        std::cerr << "Error: Only one source may be given per run" << std::endl;
        return EXIT_USAGE;
    }
    if (args.sources.empty() && !args.test_connection) {
        std::cerr << "Error: No URL or file specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_USAGE;
    }

    auto config = load_config(args);
    if (!config) {
        std::cerr << "Error: Could not load config "
                  << (args.config_path.empty() ? scribe::core::ClientConfig::default_path() : args.config_path)
                  << ": " << config.error().message() << std::endl;
        return EXIT_USAGE;
    }
    apply_overrides(args, *config);

    if (auto ec = config->validate()) {
        std::cerr << "Error: Invalid configuration: " << ec.message() << std::endl;
        return EXIT_USAGE;
    }

    auto level = config->verbose ? spdlog::level::debug
               : args.quiet      ? spdlog::level::warn
                                 : spdlog::level::info;
    if (auto ec = scribe::log::init(level, config->log_file)) {
        std::cerr << "Error: Could not open log file " << config->log_file << ": " << ec.message() << std::endl;
        return EXIT_USAGE;
    }

    // SIGINT/SIGTERM only set a flag; the watcher turns it into a stop request
    std::stop_source stop;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::jthread watcher([&stop](std::stop_token wtoken) {
        while (!wtoken.stop_requested()) {
            if (g_signal != 0) {
                spdlog::warn("Interrupted, stopping (in-flight chunks will finish)");
                stop.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int exit_code = EXIT_OK;
    if (args.test_connection) {
        exit_code = test_connection(*config, stop.get_token());
    } else {
        exit_code = transcribe(args.sources.front(), *config, args.quiet, stop.get_token());
    }

    watcher.request_stop();
    watcher.join();

    if (g_signal != 0 && exit_code != EXIT_OK) {
        exit_code = EXIT_CANCELLED;
    }
    spdlog::shutdown();
    return exit_code;
}
