// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scribe/media/process.hpp>
#include <scribe/media/error.hpp>
#include <array>
#include <cerrno>
#include <cstdio>
#include <memory>
#include <sstream>
#include <sys/wait.h>

namespace scribe::media {

namespace {

// Closes the pipe on early exit; close() hands back the wait status
struct Pipe {
    FILE* handle{nullptr};

    explicit Pipe(FILE* f) : handle(f) {}
    ~Pipe() { if (handle) ::pclose(handle); }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int close() noexcept {
        int status = ::pclose(handle);
        handle = nullptr;
        return status;
    }
};

} // namespace

std::vector<std::string> ProcessResult::lines() const {
    std::vector<std::string> out;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        out.push_back(std::move(line));
    }
    return out;
}

std::string shell_quote(std::string_view arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::expected<ProcessResult, std::error_code>
run_process(const std::vector<std::string>& argv) noexcept {
    try {
        std::string command;
        for (const auto& arg : argv) {
            if (!command.empty()) command += ' ';
            command += shell_quote(arg);
        }
        command += " 2>&1";

        Pipe pipe(::popen(command.c_str(), "r"));
        if (!pipe.handle) {
            return std::unexpected(std::error_code(errno, std::generic_category()));
        }

        ProcessResult result;
        std::array<char, 4096> buffer{};
        std::size_t got = 0;
        while ((got = std::fread(buffer.data(), 1, buffer.size(), pipe.handle)) > 0) {
            result.output.append(buffer.data(), got);
        }

        int status = pipe.close();
        if (status == -1) {
            return std::unexpected(std::error_code(errno, std::generic_category()));
        }
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
        return result;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(FetchErrc::download_failed));
    }
}

} // namespace scribe::media
